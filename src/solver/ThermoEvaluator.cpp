#include "statmech/solver/ThermoEvaluator.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <cmath>
#include <sstream>

namespace Statmech {

using Constants::kIdealGasConstant;

ThermoEvaluator::ThermoEvaluator(const Tolerances& tolerances)
    : tolerances_(tolerances)
{
}

int ThermoEvaluator::prepare(const Conformer& conformer, const PartitionSettings& settings,
                             std::string& detail) {
    int info = partition_.prepare(conformer, settings, detail);
    if (info != 0) {
        return info;
    }
    dE0_ = conformer.E0.valueIn("J/mol");
    return ErrorCode::kSuccess;
}

int ThermoEvaluator::evaluate(double T, ThermoPoint& point) const {
    PartitionTerms terms;
    int info = partition_.evaluate(T, terms);
    if (info != 0) {
        return info;
    }

    point.dTemperature = T;
    point.dHeatCapacity = kIdealGasConstant * (T * T * terms.d2lnQdT2 + 2.0 * T * terms.dlnQdT);
    point.dEnthalpy = dE0_ + kIdealGasConstant * T * T * terms.dlnQdT;
    point.dEntropy = kIdealGasConstant * (terms.lnQ + T * terms.dlnQdT);
    point.dGibbsEnergy = point.dEnthalpy - T * point.dEntropy;

    if (!std::isfinite(point.dHeatCapacity) || !std::isfinite(point.dEnthalpy) ||
        !std::isfinite(point.dEntropy) ||
        point.dHeatCapacity < -tolerances_[kTolNegativeCp]) {
        return ErrorCode::kNonPhysicalResult;
    }
    return ErrorCode::kSuccess;
}

int ThermoEvaluator::sample(const std::vector<double>& temperatures,
                            std::vector<ThermoPoint>& points, std::string& detail) const {
    const int n = static_cast<int>(temperatures.size());
    points.assign(temperatures.size(), ThermoPoint{});
    std::vector<int> codes(temperatures.size(), 0);

    #pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        codes[i] = evaluate(temperatures[i], points[i]);
    }

    for (int i = 0; i < n; ++i) {
        if (codes[i] != 0) {
            std::ostringstream msg;
            msg << ErrorCode::getMessage(codes[i]) << " at T = " << temperatures[i] << " K";
            if (codes[i] == ErrorCode::kNonPhysicalResult) {
                msg << " (Cp = " << points[i].dHeatCapacity << " J/(mol*K))";
            }
            detail = msg.str();
            return codes[i];
        }
    }
    return ErrorCode::kSuccess;
}

std::pair<double, int> ThermoEvaluator::getHeatCapacity(double T) const {
    ThermoPoint point;
    int info = evaluate(T, point);
    return {point.dHeatCapacity, info};
}

std::pair<double, int> ThermoEvaluator::getEnthalpy(double T) const {
    ThermoPoint point;
    int info = evaluate(T, point);
    return {point.dEnthalpy, info};
}

std::pair<double, int> ThermoEvaluator::getEntropy(double T) const {
    ThermoPoint point;
    int info = evaluate(T, point);
    return {point.dEntropy, info};
}

ThermoFunctions ThermoEvaluator::functions() const {
    ThermoFunctions f;
    f.heatCapacity = [this](double T) { return getHeatCapacity(T).first; };
    f.enthalpy = [this](double T) { return getEnthalpy(T).first; };
    f.entropy = [this](double T) { return getEntropy(T).first; };
    return f;
}

} // namespace Statmech
