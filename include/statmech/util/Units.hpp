/// @file Units.hpp
/// @brief Physical dimensions and the registry of units accepted in species records
/// @details Every unit string carried by a Quantity must resolve to an entry of
/// this registry. Units are a closed set: compound expressions are registered
/// explicitly rather than parsed.

#pragma once

#include <string>
#include <vector>

namespace Statmech {

/// @brief Integer exponents over the base dimensions (M, L, T, Theta, N)
struct Dimension {
    int mass = 0;
    int length = 0;
    int time = 0;
    int temperature = 0;
    int amount = 0;

    constexpr Dimension() = default;
    constexpr Dimension(int m, int l, int t, int theta, int n)
        : mass(m), length(l), time(t), temperature(theta), amount(n) {}

    constexpr bool operator==(const Dimension& other) const {
        return mass == other.mass && length == other.length && time == other.time &&
               temperature == other.temperature && amount == other.amount;
    }
    constexpr bool operator!=(const Dimension& other) const { return !(*this == other); }

    /// @brief Render as e.g. "M L^2 T^-2 N^-1" ("dimensionless" when all zero)
    std::string toString() const;
};

namespace Dimensions {

constexpr Dimension kDimensionless{};
constexpr Dimension kMass{1, 0, 0, 0, 0};
constexpr Dimension kMolarMass{1, 0, 0, 0, -1};
constexpr Dimension kLength{0, 1, 0, 0, 0};
constexpr Dimension kTime{0, 0, 1, 0, 0};
constexpr Dimension kTemperature{0, 0, 0, 1, 0};
constexpr Dimension kEnergy{1, 2, -2, 0, 0};
constexpr Dimension kMolarEnergy{1, 2, -2, 0, -1};
constexpr Dimension kMolarHeatCapacity{1, 2, -2, -1, -1};
constexpr Dimension kWavenumber{0, -1, 0, 0, 0};
constexpr Dimension kMomentOfInertia{1, 2, 0, 0, 0};
constexpr Dimension kPressure{1, -1, -2, 0, 0};

} // namespace Dimensions

/// @brief One registered unit
struct Unit {
    const char* symbol;     ///< Unit string as written in records
    Dimension dimension;    ///< Physical dimension
    double factorToSI;      ///< value_SI = value * factorToSI
    const char* category;   ///< Human-readable dimension name
};

/// @brief Look up a unit by its record symbol
/// @param symbol Unit string (e.g. "kJ/mol", "amu*angstrom^2")
/// @return Registered unit, or nullptr if unknown
const Unit* findUnit(const std::string& symbol);

/// @brief Check whether a unit string is registered
bool isKnownUnit(const std::string& symbol);

/// @brief All registered unit symbols (for diagnostics)
std::vector<std::string> getRegisteredUnits();

} // namespace Statmech
