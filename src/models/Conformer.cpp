#include "statmech/models/Conformer.hpp"
#include "statmech/util/ElementData.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <Eigen/Eigenvalues>

namespace Statmech {

int Conformer::getAtomCount() const {
    return hasGeometry() ? static_cast<int>(coordinates.rows()) : 0;
}

int Conformer::validate(std::string& detail) const {
    if (!E0.hasDimension(Dimensions::kMolarEnergy) || E0.isArray()) {
        detail = "Conformer.E0 has units [" + E0.units() + "], expected a molar energy";
        return ErrorCode::kUnitMismatch;
    }
    if (opticalIsomers < 1 || spinMultiplicity < 1) {
        detail = "Conformer: opticalIsomers and spinMultiplicity must be positive";
        return ErrorCode::kInvalidConformer;
    }

    if (hasGeometry() || !mass.empty() || !atomicNumbers.empty()) {
        if (!coordinates.hasDimension(Dimensions::kLength)) {
            detail = "Conformer.coordinates has units [" + coordinates.units() + "]";
            return ErrorCode::kUnitMismatch;
        }
        if (!mass.hasDimension(Dimensions::kMass)) {
            detail = "Conformer.mass has units [" + mass.units() + "]";
            return ErrorCode::kUnitMismatch;
        }
        if (coordinates.columns() != 3) {
            detail = "Conformer.coordinates must have 3 columns";
            return ErrorCode::kInvalidConformer;
        }
        std::size_t nAtoms = coordinates.rows();
        if (mass.size() != nAtoms || atomicNumbers.size() != nAtoms) {
            detail = "Conformer: " + std::to_string(nAtoms) + " coordinates, " +
                     std::to_string(mass.size()) + " masses, " +
                     std::to_string(atomicNumbers.size()) + " atomic numbers";
            return ErrorCode::kInvalidConformer;
        }
        for (int z : atomicNumbers) {
            if (z < 1 || z > Constants::kNumElementsPT) {
                detail = "Conformer: invalid atomic number " + std::to_string(z);
                return ErrorCode::kInvalidConformer;
            }
        }
    }

    for (std::size_t i = 0; i < modes.size(); ++i) {
        int info = validateMode(modes[i], detail);
        if (info != 0) {
            detail = "mode " + std::to_string(i) + ": " + detail;
            return info;
        }
    }
    return ErrorCode::kSuccess;
}

double Conformer::getTotalMass() const {
    double total = 0.0;
    for (double m : mass.valuesSI()) {
        total += m;
    }
    return total;
}

Eigen::Vector3d Conformer::getCenterOfMass() const {
    Eigen::Vector3d center = Eigen::Vector3d::Zero();
    std::vector<double> xyz = coordinates.valuesSI();
    std::vector<double> m = mass.valuesSI();
    double total = 0.0;
    for (std::size_t i = 0; i < m.size(); ++i) {
        center += m[i] * Eigen::Vector3d(xyz[3 * i], xyz[3 * i + 1], xyz[3 * i + 2]);
        total += m[i];
    }
    if (total > 0.0) {
        center /= total;
    }
    return center;
}

Quantity Conformer::getPrincipalMomentsOfInertia() const {
    Eigen::Vector3d center = getCenterOfMass();
    std::vector<double> xyz = coordinates.valuesSI();
    std::vector<double> m = mass.valuesSI();

    Eigen::Matrix3d inertia = Eigen::Matrix3d::Zero();
    for (std::size_t i = 0; i < m.size(); ++i) {
        Eigen::Vector3d r = Eigen::Vector3d(xyz[3 * i], xyz[3 * i + 1], xyz[3 * i + 2]) - center;
        inertia += m[i] * (r.squaredNorm() * Eigen::Matrix3d::Identity() - r * r.transpose());
    }

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(inertia);
    Eigen::Vector3d moments = solver.eigenvalues();   // ascending
    double toRecordUnits = findUnit("amu*angstrom^2")->factorToSI;

    std::vector<double> values(3);
    for (int i = 0; i < 3; ++i) {
        values[i] = moments(i) / toRecordUnits;
    }
    return Quantity(std::move(values), "amu*angstrom^2");
}

std::string Conformer::getMolecularFormula() const {
    return molecularFormula(atomicNumbers);
}

int Conformer::countModes(Constants::ModeType type) const {
    int count = 0;
    for (const auto& mode : modes) {
        if (getModeType(mode) == type) {
            ++count;
        }
    }
    return count;
}

} // namespace Statmech
