#include "statmech/solver/NASAFitter.hpp"
#include "statmech/interfaces/ITmidSelector.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace Statmech {

using Constants::kIdealGasConstant;
using Constants::kNumNASAFitCoeff;

namespace {

constexpr int kNumUnknowns = 2 * kNumNASAFitCoeff;
constexpr int kNumConstraints = 2;

/// H/RT without the a6/T term
double enthalpyPolynomial(const NASACoefficients& a, double T) {
    return a[0] + T * (a[1] / 2.0 + T * (a[2] / 3.0 + T * (a[3] / 4.0 + T * a[4] / 5.0)));
}

/// S/R without the a7 term
double entropyPolynomial(const NASACoefficients& a, double T) {
    return a[0] * std::log(T) + T * (a[1] + T * (a[2] / 2.0 + T * (a[3] / 3.0 + T * a[4] / 4.0)));
}

/// Local variable of one polynomial range, tau = (T - centre) / halfWidth in [-1, 1]
struct RangeScale {
    double centre;
    double halfWidth;

    RangeScale(double lo, double hi) : centre(0.5 * (lo + hi)), halfWidth(0.5 * (hi - lo)) {}

    double tau(double T) const { return (T - centre) / halfWidth; }
};

/// Coefficients in powers of T of sum_k b_k tau^k
NASACoefficients toTemperaturePowers(const Eigen::VectorXd& b, const RangeScale& scale) {
    NASACoefficients a{};
    for (int k = 0; k < kNumNASAFitCoeff; ++k) {
        // (T - c)^k = sum_j C(k, j) T^j (-c)^(k - j)
        double factor = b(k) / std::pow(scale.halfWidth, k);
        double binomial = 1.0;
        for (int j = 0; j <= k; ++j) {
            a[j] += factor * binomial * std::pow(-scale.centre, k - j);
            binomial = binomial * (k - j) / (j + 1);
        }
    }
    return a;
}

struct Sample {
    double T;
    double cpR;
    double hRT;
    double sR;
};

int sampleFunctions(const ThermoFunctions& f, const std::vector<double>& temperatures,
                    std::vector<Sample>& out) {
    out.clear();
    out.reserve(temperatures.size());
    for (double T : temperatures) {
        Sample s{T,
                 f.heatCapacity(T) / kIdealGasConstant,
                 f.enthalpy(T) / (kIdealGasConstant * T),
                 f.entropy(T) / kIdealGasConstant};
        if (!std::isfinite(s.cpR) || !std::isfinite(s.hRT) || !std::isfinite(s.sR)) {
            return ErrorCode::kNonPhysicalResult;
        }
        out.push_back(s);
    }
    return ErrorCode::kSuccess;
}

} // namespace

NASAFitter::NASAFitter(const Tolerances& tolerances, int nSamplePoints)
    : tolerances_(tolerances)
    , nSamplePoints_(std::max(nSamplePoints, kNumNASAFitCoeff))
{
}

int NASAFitter::checkRange(double Tmin, double Tmid, double Tmax) {
    if (!(Tmin > 0.0) || !(Tmin < Tmid) || !(Tmid < Tmax) || !std::isfinite(Tmax)) {
        return ErrorCode::kInvalidFitConfiguration;
    }
    return ErrorCode::kSuccess;
}

std::vector<double> NASAFitter::samples(double lo, double hi) const {
    std::vector<double> t(nSamplePoints_);
    for (int i = 0; i < nSamplePoints_; ++i) {
        t[i] = lo + (hi - lo) * i / (nSamplePoints_ - 1);
    }
    return t;
}

int NASAFitter::fitWithTmid(const ThermoFunctions& functions,
                            double Tmin, double Tmid, double Tmax,
                            NASA& model, double& residual) const {
    residual = 0.0;
    int info = checkRange(Tmin, Tmid, Tmax);
    if (info != 0) {
        return info;
    }
    if (!functions.isValid()) {
        return ErrorCode::kNoThermoModel;
    }

    std::vector<Sample> lowSamples;
    std::vector<Sample> highSamples;
    info = sampleFunctions(functions, samples(Tmin, Tmid), lowSamples);
    if (info == 0) {
        info = sampleFunctions(functions, samples(Tmid, Tmax), highSamples);
    }
    if (info != 0) {
        return info;
    }

    // Stage 1: a1..a5 of both ranges against Cp/R, each range in its own
    // variable tau, solved on the design matrix in the null space of the
    // continuity constraints
    const RangeScale lowScale(Tmin, Tmid);
    const RangeScale highScale(Tmid, Tmax);
    const int nRows = static_cast<int>(lowSamples.size() + highSamples.size());
    Eigen::MatrixXd design = Eigen::MatrixXd::Zero(nRows, kNumUnknowns);
    Eigen::VectorXd target(nRows);
    int row = 0;
    auto fillRows = [&](const std::vector<Sample>& range, const RangeScale& scale, int offset) {
        for (const auto& s : range) {
            double tau = scale.tau(s.T);
            double p = 1.0;
            for (int k = 0; k < kNumNASAFitCoeff; ++k) {
                design(row, offset + k) = p;
                p *= tau;
            }
            target(row) = s.cpR;
            ++row;
        }
    };
    fillRows(lowSamples, lowScale, 0);
    fillRows(highSamples, highScale, kNumNASAFitCoeff);

    // Cp and dCp/dT equal at Tmid: tau = +1 of the low range, tau = -1 of the high range
    Eigen::MatrixXd constraints = Eigen::MatrixXd::Zero(kNumConstraints, kNumUnknowns);
    for (int k = 0; k < kNumNASAFitCoeff; ++k) {
        double highValue = std::pow(-1.0, k);
        constraints(0, k) = 1.0;
        constraints(0, kNumNASAFitCoeff + k) = -highValue;
        if (k > 0) {
            constraints(1, k) = k / lowScale.halfWidth;
            constraints(1, kNumNASAFitCoeff + k) = -k * std::pow(-1.0, k - 1) / highScale.halfWidth;
        }
    }
    Eigen::HouseholderQR<Eigen::MatrixXd> constraintQR(constraints.transpose());
    Eigen::MatrixXd q = constraintQR.householderQ();
    Eigen::MatrixXd nullSpace = q.rightCols(kNumUnknowns - kNumConstraints);

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> lsq(design * nullSpace);
    lsq.setThreshold(tolerances_[kTolSingularPivot]);
    if (lsq.rank() < kNumUnknowns - kNumConstraints) {
        return ErrorCode::kSingularFitSystem;
    }
    Eigen::VectorXd solution = nullSpace * lsq.solve(target);

    NASACoefficients low = toTemperaturePowers(solution.head(kNumNASAFitCoeff), lowScale);
    NASACoefficients high = toTemperaturePowers(solution.tail(kNumNASAFitCoeff), highScale);

    // Stage 2: integration constants
    double tRef = std::min(std::max(Constants::kStandardTemperature, Tmin), Tmax);
    double hRef = functions.enthalpy(tRef) / (kIdealGasConstant * tRef);
    double sRef = functions.entropy(tRef) / kIdealGasConstant;
    NASACoefficients& anchored = (tRef <= Tmid) ? low : high;
    NASACoefficients& joined = (tRef <= Tmid) ? high : low;
    anchored[5] = (hRef - enthalpyPolynomial(anchored, tRef)) * tRef;
    anchored[6] = sRef - entropyPolynomial(anchored, tRef);
    joined[5] = (enthalpyPolynomial(anchored, Tmid) + anchored[5] / Tmid -
                 enthalpyPolynomial(joined, Tmid)) * Tmid;
    joined[6] = entropyPolynomial(anchored, Tmid) + anchored[6] - entropyPolynomial(joined, Tmid);

    model.low.coeffs = low;
    model.low.dTmin = Tmin;
    model.low.dTmax = Tmid;
    model.high.coeffs = high;
    model.high.dTmin = Tmid;
    model.high.dTmax = Tmax;

    // Residual over every sample
    double sumSq = 0.0;
    int count = 0;
    auto addResiduals = [&](const NASAPolynomial& poly, const std::vector<Sample>& range) {
        for (const auto& s : range) {
            double dCp = poly.getHeatCapacity(s.T) / kIdealGasConstant - s.cpR;
            double dH = poly.getEnthalpy(s.T) / (kIdealGasConstant * s.T) - s.hRT;
            double dS = poly.getEntropy(s.T) / kIdealGasConstant - s.sR;
            sumSq += dCp * dCp + dH * dH + dS * dS;
            count += 3;
        }
    };
    addResiduals(model.low, lowSamples);
    addResiduals(model.high, highSamples);
    residual = std::sqrt(sumSq / count);
    return ErrorCode::kSuccess;
}

int NASAFitter::fit(const ThermoFunctions& functions,
                    double Tmin, double Tmax,
                    const ITmidSelector& selector,
                    NASA& model, NASAFitReport& report) const {
    report = NASAFitReport{};
    if (!(Tmin > 0.0) || !(Tmin < Tmax)) {
        return ErrorCode::kInvalidFitConfiguration;
    }
    if (!functions.isValid()) {
        return ErrorCode::kNoThermoModel;
    }

    double tmid = 0.0;
    int info = selector.selectTmid(*this, functions, Tmin, Tmax, tmid, report);
    if (info != 0) {
        if (iPrintMode_ > 0) {
            std::cerr << "[NASAFitter] " << selector.getSelectorName() << " failed: "
                      << ErrorCode::getMessage(info) << std::endl;
        }
        return info;
    }

    double residual = 0.0;
    info = fitWithTmid(functions, Tmin, tmid, Tmax, model, residual);
    if (info != 0) {
        return info;
    }
    report.dTmid = tmid;
    report.dResidual = residual;
    report.dContinuityError = model.getContinuityError();

    if (iPrintMode_ > 1) {
        std::cerr << "[NASAFitter] Tmid = " << tmid << " K, residual = " << residual
                  << ", continuity error = " << report.dContinuityError << std::endl;
    }

    if (residual > tolerances_[kTolFitResidual] ||
        report.dContinuityError > tolerances_[kTolContinuity]) {
        if (iPrintMode_ > 0) {
            std::cerr << "[NASAFitter] Warning: residual " << residual << " exceeds tolerance "
                      << tolerances_[kTolFitResidual] << std::endl;
        }
        return ErrorCode::kPoorFitQuality;
    }
    return ErrorCode::kSuccess;
}

} // namespace Statmech
