#include "statmech/postprocess/ThermoTable.hpp"
#include "statmech/util/ErrorCodes.hpp"

namespace Statmech {

int buildThermoTable(const NASA& model, ThermoTable& table) {
    table = ThermoTable{};
    for (double T : Constants::kThermoTableTemperatures) {
        auto [cp, info] = model.getHeatCapacity(T);
        if (info == 0) {
            table.heatCapacities.emplace_back(T, cp / Constants::kCalorie);
        }
    }

    auto [h, infoH] = model.getEnthalpy(Constants::kStandardTemperature);
    auto [s, infoS] = model.getEntropy(Constants::kStandardTemperature);
    if (infoH != 0 || infoS != 0) {
        return ErrorCode::kInvalidTemperature;
    }
    table.dH298 = h / (1000.0 * Constants::kCalorie);
    table.dS298 = s / Constants::kCalorie;
    return ErrorCode::kSuccess;
}

} // namespace Statmech
