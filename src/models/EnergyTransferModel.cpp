#include "statmech/models/EnergyTransferModel.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <cmath>

namespace Statmech {

int SingleExponentialDown::validate(std::string& detail) const {
    if (!alpha0.hasDimension(Dimensions::kMolarEnergy) || alpha0.isArray()) {
        detail = "energy_transfer_model.alpha0 has units [" + alpha0.units() + "]";
        return ErrorCode::kUnitMismatch;
    }
    if (!T0.hasDimension(Dimensions::kTemperature) || T0.isArray()) {
        detail = "energy_transfer_model.T0 has units [" + T0.units() + "]";
        return ErrorCode::kUnitMismatch;
    }
    if (!(alpha0.value() > 0.0) || !(T0.value() > 0.0)) {
        detail = "energy_transfer_model: alpha0 and T0 must be positive";
        return ErrorCode::kInvalidEnergyTransfer;
    }
    if (!std::isfinite(n)) {
        detail = "energy_transfer_model: exponent n is not finite";
        return ErrorCode::kInvalidEnergyTransfer;
    }
    return ErrorCode::kSuccess;
}

std::pair<Quantity, int> SingleExponentialDown::averageDownwardEnergy(double T) const {
    std::string detail;
    int info = validate(detail);
    if (info != 0) {
        return {Quantity(0.0, alpha0.units()), info};
    }
    if (!(T > 0.0)) {
        return {Quantity(0.0, alpha0.units()), ErrorCode::kInvalidTemperature};
    }
    return {alpha0 * std::pow(T / T0.valueIn("K"), n), ErrorCode::kSuccess};
}

} // namespace Statmech
