/// @file Units.cpp
/// @brief Unit registry

#include "statmech/util/Units.hpp"
#include "statmech/util/Constants.hpp"
#include <sstream>

namespace Statmech {

namespace {

constexpr double kAmu = Constants::kAtomicMassUnit;
constexpr double kAngstrom = 1.0e-10;

const Unit kUnitTable[] = {
    // Dimensionless (atomic numbers, counts)
    {"", Dimensions::kDimensionless, 1.0, "dimensionless"},

    // Molar energy
    {"J/mol", Dimensions::kMolarEnergy, 1.0, "molar energy"},
    {"kJ/mol", Dimensions::kMolarEnergy, 1.0e3, "molar energy"},
    {"cal/mol", Dimensions::kMolarEnergy, Constants::kCalorie, "molar energy"},
    {"kcal/mol", Dimensions::kMolarEnergy, 1.0e3 * Constants::kCalorie, "molar energy"},

    // Molecular energy
    {"J", Dimensions::kEnergy, 1.0, "energy"},
    {"eV", Dimensions::kEnergy, Constants::kElectronVolt, "energy"},

    // Spectroscopic wavenumber
    {"cm^-1", Dimensions::kWavenumber, 100.0, "wavenumber"},
    {"m^-1", Dimensions::kWavenumber, 1.0, "wavenumber"},

    // Mass
    {"amu", Dimensions::kMass, kAmu, "mass"},
    {"kg", Dimensions::kMass, 1.0, "mass"},
    {"g/mol", Dimensions::kMolarMass, 1.0e-3, "molar mass"},
    {"kg/mol", Dimensions::kMolarMass, 1.0, "molar mass"},

    // Length
    {"m", Dimensions::kLength, 1.0, "length"},
    {"angstrom", Dimensions::kLength, kAngstrom, "length"},
    {"angstroms", Dimensions::kLength, kAngstrom, "length"},
    {"bohr", Dimensions::kLength, Constants::kBohrRadius, "length"},

    // Time
    {"s", Dimensions::kTime, 1.0, "time"},

    // Temperature
    {"K", Dimensions::kTemperature, 1.0, "temperature"},

    // Moment of inertia
    {"amu*angstrom^2", Dimensions::kMomentOfInertia, kAmu * kAngstrom * kAngstrom, "moment of inertia"},
    {"kg*m^2", Dimensions::kMomentOfInertia, 1.0, "moment of inertia"},

    // Heat capacity / entropy
    {"J/(mol*K)", Dimensions::kMolarHeatCapacity, 1.0, "molar heat capacity"},
    {"cal/(mol*K)", Dimensions::kMolarHeatCapacity, Constants::kCalorie, "molar heat capacity"},

    // Pressure
    {"Pa", Dimensions::kPressure, 1.0, "pressure"},
    {"bar", Dimensions::kPressure, 1.0e5, "pressure"},
    {"atm", Dimensions::kPressure, 101325.0, "pressure"},
};

} // namespace

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    auto append = [&](const char* symbol, int exponent) {
        if (exponent == 0) return;
        if (!first) ss << " ";
        ss << symbol;
        if (exponent != 1) ss << "^" << exponent;
        first = false;
    };

    append("M", mass);
    append("L", length);
    append("T", time);
    append("Theta", temperature);
    append("N", amount);

    return first ? "dimensionless" : ss.str();
}

const Unit* findUnit(const std::string& symbol) {
    for (const auto& unit : kUnitTable) {
        if (symbol == unit.symbol) {
            return &unit;
        }
    }
    return nullptr;
}

bool isKnownUnit(const std::string& symbol) {
    return findUnit(symbol) != nullptr;
}

std::vector<std::string> getRegisteredUnits() {
    std::vector<std::string> symbols;
    for (const auto& unit : kUnitTable) {
        symbols.emplace_back(unit.symbol);
    }
    return symbols;
}

} // namespace Statmech
