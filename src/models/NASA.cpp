#include "statmech/models/NASA.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <algorithm>
#include <cmath>

namespace Statmech {

using Constants::kIdealGasConstant;

double NASAPolynomial::getHeatCapacity(double T) const {
    const auto& a = coeffs;
    double cpR = a[0] + T * (a[1] + T * (a[2] + T * (a[3] + T * a[4])));
    return cpR * kIdealGasConstant;
}

double NASAPolynomial::getEnthalpy(double T) const {
    const auto& a = coeffs;
    double hRT = a[0] + T * (a[1] / 2.0 + T * (a[2] / 3.0 + T * (a[3] / 4.0 + T * a[4] / 5.0))) +
                 a[5] / T;
    return hRT * kIdealGasConstant * T;
}

double NASAPolynomial::getEntropy(double T) const {
    const auto& a = coeffs;
    double sR = a[0] * std::log(T) + T * (a[1] + T * (a[2] / 2.0 + T * (a[3] / 3.0 + T * a[4] / 4.0))) +
                a[6];
    return sR * kIdealGasConstant;
}

double NASAPolynomial::getGibbsEnergy(double T) const {
    return getEnthalpy(T) - T * getEntropy(T);
}

const NASAPolynomial* NASA::selectPolynomial(double T) const {
    if (low.isValidAt(T)) {
        return &low;
    }
    if (high.isValidAt(T)) {
        return &high;
    }
    return nullptr;
}

std::pair<double, int> NASA::getHeatCapacity(double T) const {
    const NASAPolynomial* poly = selectPolynomial(T);
    if (!poly) {
        return {0.0, ErrorCode::kInvalidTemperature};
    }
    return {poly->getHeatCapacity(T), 0};
}

std::pair<double, int> NASA::getEnthalpy(double T) const {
    const NASAPolynomial* poly = selectPolynomial(T);
    if (!poly) {
        return {0.0, ErrorCode::kInvalidTemperature};
    }
    return {poly->getEnthalpy(T), 0};
}

std::pair<double, int> NASA::getEntropy(double T) const {
    const NASAPolynomial* poly = selectPolynomial(T);
    if (!poly) {
        return {0.0, ErrorCode::kInvalidTemperature};
    }
    return {poly->getEntropy(T), 0};
}

std::pair<double, int> NASA::getGibbsEnergy(double T) const {
    const NASAPolynomial* poly = selectPolynomial(T);
    if (!poly) {
        return {0.0, ErrorCode::kInvalidTemperature};
    }
    return {poly->getGibbsEnergy(T), 0};
}

double NASA::getContinuityError() const {
    double tmid = getTmid();
    auto relative = [](double a, double b) {
        double scale = std::max({std::abs(a), std::abs(b), 1.0});
        return std::abs(a - b) / scale;
    };
    return std::max({relative(low.getHeatCapacity(tmid), high.getHeatCapacity(tmid)),
                     relative(low.getEnthalpy(tmid), high.getEnthalpy(tmid)),
                     relative(low.getEntropy(tmid), high.getEntropy(tmid))});
}

int NASA::validate() const {
    if (!(low.dTmin > 0.0) || !(low.dTmin < low.dTmax) || !(high.dTmin < high.dTmax) ||
        low.dTmax != high.dTmin) {
        return ErrorCode::kInvalidFitConfiguration;
    }
    return ErrorCode::kSuccess;
}

} // namespace Statmech
