/// @file ThermoTable.hpp
/// @brief Human-auditable sampled rendering of a NASA model

#pragma once

#include "statmech/models/NASA.hpp"
#include <utility>
#include <vector>

namespace Statmech {

/// @brief Cp at the standard table temperatures plus H298 and S298
/// @details Always derived from a NASA model, never read back as data.
struct ThermoTable {
    std::vector<std::pair<double, double>> heatCapacities;   ///< (T [K], Cp [cal/(mol·K)])
    double dH298 = 0.0;                                      ///< [kcal/mol]
    double dS298 = 0.0;                                      ///< [cal/(mol·K)]
};

/// @brief Evaluate the table from a fitted model
/// @param model Fitted NASA model
/// @param table Output; temperatures outside the model range are skipped
/// @return Error code (0 = success, kInvalidTemperature if 298.15 K is outside the range)
int buildThermoTable(const NASA& model, ThermoTable& table);

} // namespace Statmech
