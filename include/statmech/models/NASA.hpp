/// @file NASA.hpp
/// @brief Two-range seven-coefficient NASA polynomial thermo model
/// @details With coefficients a1..a7 and T in kelvin:
///   Cp/R = a1 + a2 T + a3 T^2 + a4 T^3 + a5 T^4
///   H/RT = a1 + a2 T/2 + a3 T^2/3 + a4 T^3/4 + a5 T^4/5 + a6/T
///   S/R  = a1 ln T + a2 T + a3 T^2/2 + a4 T^3/3 + a5 T^4/4 + a7

#pragma once

#include "statmech/util/Constants.hpp"
#include <array>
#include <utility>

namespace Statmech {

using NASACoefficients = std::array<double, Constants::kNumNASACoeff>;

/// @brief One polynomial range
struct NASAPolynomial {
    NASACoefficients coeffs{};
    double dTmin = 0.0;     ///< [K]
    double dTmax = 0.0;     ///< [K]

    /// @brief Heat capacity [J/(mol·K)]
    double getHeatCapacity(double T) const;

    /// @brief Enthalpy [J/mol]
    double getEnthalpy(double T) const;

    /// @brief Entropy [J/(mol·K)]
    double getEntropy(double T) const;

    /// @brief Gibbs energy H - TS [J/mol]
    double getGibbsEnergy(double T) const;

    bool isValidAt(double T) const { return T >= dTmin && T <= dTmax; }
};

/// @brief Two contiguous polynomial ranges [Tmin, Tmid] and [Tmid, Tmax]
struct NASA {
    NASAPolynomial low;
    NASAPolynomial high;
    double dE0 = 0.0;       ///< Reference ground-state energy [J/mol]
    double dCp0 = 0.0;      ///< Cp as T -> 0 [J/(mol·K)]
    double dCpInf = 0.0;    ///< Cp as T -> infinity [J/(mol·K)]

    double getTmin() const { return low.dTmin; }
    double getTmid() const { return low.dTmax; }
    double getTmax() const { return high.dTmax; }

    /// @brief Polynomial covering T (the low range at exactly Tmid)
    /// @return Pointer to the polynomial, nullptr outside [Tmin, Tmax]
    const NASAPolynomial* selectPolynomial(double T) const;

    /// @brief Heat capacity [J/(mol·K)]
    /// @return Pair of (value, error code); kInvalidTemperature outside the range
    std::pair<double, int> getHeatCapacity(double T) const;

    /// @brief Enthalpy [J/mol]
    std::pair<double, int> getEnthalpy(double T) const;

    /// @brief Entropy [J/(mol·K)]
    std::pair<double, int> getEntropy(double T) const;

    /// @brief Gibbs energy [J/mol]
    std::pair<double, int> getGibbsEnergy(double T) const;

    /// @brief Largest relative mismatch of Cp, H and S between the ranges at Tmid
    double getContinuityError() const;

    /// @brief Check range layout Tmin < Tmid < Tmax
    /// @return Error code (0 = success, kInvalidFitConfiguration)
    int validate() const;
};

} // namespace Statmech
