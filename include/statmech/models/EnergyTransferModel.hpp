/// @file EnergyTransferModel.hpp
/// @brief Collisional energy transfer parameters for pressure-dependent kinetics

#pragma once

#include "statmech/util/Quantity.hpp"
#include <string>
#include <utility>

namespace Statmech {

/// @brief Single-exponential-down model <dE_down>(T) = alpha0 (T/T0)^n
/// @details Attached once per species and not touched by the thermo fit.
struct SingleExponentialDown {
    Quantity alpha0{0.0, "kJ/mol"};
    Quantity T0{300.0, "K"};
    double n = 0.0;

    /// @brief Check positivity and dimensions of alpha0 and T0
    /// @param detail Output: description of the problem
    /// @return Error code (0 = success, kInvalidEnergyTransfer, kUnitMismatch)
    int validate(std::string& detail) const;

    /// @brief Average energy transferred in deactivating collisions
    /// @param T Temperature [K]
    /// @return Pair of (<dE_down> in the units of alpha0, error code)
    std::pair<Quantity, int> averageDownwardEnergy(double T) const;
};

} // namespace Statmech
