#include "statmech/models/Modes.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace Statmech {

namespace {

using Constants::kPi;

int checkDimension(const Quantity& q, const Dimension& dim, const std::string& field,
                   std::string& detail) {
    if (!q.hasDimension(dim)) {
        detail = field + " has units [" + q.units() + "], expected " + dim.toString();
        return ErrorCode::kUnitMismatch;
    }
    return ErrorCode::kSuccess;
}

int checkSymmetry(int symmetry, const char* mode, std::string& detail) {
    if (symmetry < 1) {
        detail = std::string(mode) + ": symmetry number " + std::to_string(symmetry) +
                 " is not a positive integer";
        return ErrorCode::kInvalidModeParameter;
    }
    return ErrorCode::kSuccess;
}

int checkPositive(const std::vector<double>& values, const std::string& field,
                  std::string& detail) {
    if (values.empty()) {
        detail = field + " is empty";
        return ErrorCode::kInvalidModeParameter;
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!(values[i] > 0.0) || !std::isfinite(values[i])) {
            detail = field + "[" + std::to_string(i) + "] = " + std::to_string(values[i]) +
                     " is not positive";
            return ErrorCode::kInvalidModeParameter;
        }
    }
    return ErrorCode::kSuccess;
}

int validateTranslation(const IdealGasTranslation& mode, std::string& detail) {
    int info = checkDimension(mode.mass, Dimensions::kMass, "IdealGasTranslation.mass", detail);
    if (info != 0) return info;
    if (mode.mass.isArray()) {
        detail = "IdealGasTranslation.mass must be a scalar";
        return ErrorCode::kInvalidModeParameter;
    }
    return checkPositive(mode.mass.values(), "IdealGasTranslation.mass", detail);
}

int validateNonlinear(const NonlinearRotor& mode, std::string& detail) {
    int info = checkDimension(mode.inertia, Dimensions::kMomentOfInertia,
                              "NonlinearRotor.inertia", detail);
    if (info != 0) return info;
    if (mode.inertia.size() != 3) {
        detail = "NonlinearRotor.inertia needs 3 principal moments, got " +
                 std::to_string(mode.inertia.size());
        return ErrorCode::kInvalidModeParameter;
    }
    info = checkPositive(mode.inertia.values(), "NonlinearRotor.inertia", detail);
    if (info != 0) return info;
    return checkSymmetry(mode.symmetry, "NonlinearRotor", detail);
}

int validateLinear(const LinearRotor& mode, std::string& detail) {
    int info = checkDimension(mode.inertia, Dimensions::kMomentOfInertia,
                              "LinearRotor.inertia", detail);
    if (info != 0) return info;
    if (mode.inertia.isArray()) {
        detail = "LinearRotor.inertia must be a single moment";
        return ErrorCode::kInvalidModeParameter;
    }
    info = checkPositive(mode.inertia.values(), "LinearRotor.inertia", detail);
    if (info != 0) return info;
    return checkSymmetry(mode.symmetry, "LinearRotor", detail);
}

int validateOscillator(const HarmonicOscillator& mode, std::string& detail) {
    int info = checkDimension(mode.frequencies, Dimensions::kWavenumber,
                              "HarmonicOscillator.frequencies", detail);
    if (info != 0) return info;
    return checkPositive(mode.frequencies.values(), "HarmonicOscillator.frequencies", detail);
}

int validateHinderedRotor(const HinderedRotor& mode, std::string& detail) {
    int info = checkDimension(mode.inertia, Dimensions::kMomentOfInertia,
                              "HinderedRotor.inertia", detail);
    if (info != 0) return info;
    if (mode.inertia.isArray()) {
        detail = "HinderedRotor.inertia must be a scalar";
        return ErrorCode::kInvalidModeParameter;
    }
    info = checkPositive(mode.inertia.values(), "HinderedRotor.inertia", detail);
    if (info != 0) return info;
    info = checkSymmetry(mode.symmetry, "HinderedRotor", detail);
    if (info != 0) return info;

    if (mode.hasFourier()) {
        info = checkDimension(mode.fourier, Dimensions::kMolarEnergy,
                              "HinderedRotor.fourier", detail);
        if (info != 0) return info;
        if (mode.fourier.rows() != 2) {
            detail = "HinderedRotor.fourier needs 2 rows (cosine, sine), got " +
                     std::to_string(mode.fourier.rows());
            return ErrorCode::kInvalidModeParameter;
        }
    } else {
        info = checkDimension(mode.barrier, Dimensions::kMolarEnergy,
                              "HinderedRotor.barrier", detail);
        if (info != 0) return info;
        info = checkPositive(mode.barrier.values(), "HinderedRotor.barrier", detail);
        if (info != 0) return info;
    }

    if (!(getTorsionalCurvature(mode) > 0.0)) {
        detail = "HinderedRotor: torsional potential has no minimum at the scan origin";
        return ErrorCode::kInvalidModeParameter;
    }
    return ErrorCode::kSuccess;
}

} // namespace

Constants::ModeType getModeType(const Mode& mode) {
    return static_cast<Constants::ModeType>(mode.index());
}

const char* getModeName(const Mode& mode) {
    return Constants::kModeTypeNames[mode.index()];
}

int validateMode(const Mode& mode, std::string& detail) {
    return std::visit([&detail](const auto& m) -> int {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, IdealGasTranslation>) {
            return validateTranslation(m, detail);
        } else if constexpr (std::is_same_v<T, NonlinearRotor>) {
            return validateNonlinear(m, detail);
        } else if constexpr (std::is_same_v<T, LinearRotor>) {
            return validateLinear(m, detail);
        } else if constexpr (std::is_same_v<T, HarmonicOscillator>) {
            return validateOscillator(m, detail);
        } else {
            return validateHinderedRotor(m, detail);
        }
    }, mode);
}

double rotationalConstantFromInertia(double inertiaSI) {
    // B [m^-1] = h / (8 pi^2 c I); reported in cm^-1
    double b = Constants::kPlanck / (8.0 * kPi * kPi * Constants::kSpeedOfLight * inertiaSI);
    return b / 100.0;
}

Quantity getRotationalConstants(const NonlinearRotor& rotor) {
    std::vector<double> constants;
    for (double inertia : rotor.inertia.valuesSI()) {
        constants.push_back(rotationalConstantFromInertia(inertia));
    }
    return Quantity(std::move(constants), "cm^-1");
}

Quantity getRotationalConstant(const LinearRotor& rotor) {
    return Quantity(rotationalConstantFromInertia(rotor.inertia.valueSI()), "cm^-1");
}

Quantity getRotationalConstant(const HinderedRotor& rotor) {
    return Quantity(rotationalConstantFromInertia(rotor.inertia.valueSI()), "cm^-1");
}

double getTorsionalPotential(const HinderedRotor& rotor, double phi) {
    if (!rotor.hasFourier()) {
        double v0 = rotor.barrier.valueIn("J/mol");
        return 0.5 * v0 * (1.0 - std::cos(rotor.symmetry * phi));
    }
    double factor = findUnit(rotor.fourier.units())->factorToSI;
    std::size_t nTerms = rotor.fourier.columns();
    double v = 0.0;
    for (std::size_t k = 0; k < nTerms; ++k) {
        double a = rotor.fourier.at(0, k) * factor;
        double b = rotor.fourier.at(1, k) * factor;
        double kPhi = static_cast<double>(k + 1) * phi;
        v += a * std::cos(kPhi) + b * std::sin(kPhi) - a;
    }
    return v;
}

double getTorsionalCurvature(const HinderedRotor& rotor) {
    if (!rotor.hasFourier()) {
        double v0 = rotor.barrier.valueIn("J/mol");
        return 0.5 * v0 * rotor.symmetry * rotor.symmetry;
    }
    double factor = findUnit(rotor.fourier.units())->factorToSI;
    double curvature = 0.0;
    for (std::size_t k = 0; k < rotor.fourier.columns(); ++k) {
        double kk = static_cast<double>(k + 1);
        curvature -= kk * kk * rotor.fourier.at(0, k) * factor;
    }
    return curvature;
}

double getTorsionalBarrier(const HinderedRotor& rotor) {
    if (!rotor.hasFourier()) {
        return rotor.barrier.valueIn("J/mol");
    }
    double vmin = std::numeric_limits<double>::max();
    double vmax = std::numeric_limits<double>::lowest();
    for (int i = 0; i < Constants::kTorsionPotentialGrid; ++i) {
        double phi = 2.0 * kPi * i / Constants::kTorsionPotentialGrid;
        double v = getTorsionalPotential(rotor, phi);
        vmin = std::min(vmin, v);
        vmax = std::max(vmax, v);
    }
    return vmax - vmin;
}

double getTorsionalFrequency(const HinderedRotor& rotor) {
    double curvature = getTorsionalCurvature(rotor);
    if (!(curvature > 0.0)) {
        return 0.0;
    }
    // V'' is per mole; divide by N_A for one molecule
    double inertia = rotor.inertia.valueSI();
    double omega = std::sqrt(curvature / (Constants::kAvogadro * inertia));
    return omega / (2.0 * kPi * Constants::kSpeedOfLight) / 100.0;
}

} // namespace Statmech
