/// @file ITmidSelector.hpp
/// @brief Interface for choosing the NASA breakpoint temperature
/// @details Implementations:
/// - FixedTmidSelector: user-chosen Tmid
/// - SearchTmidSelector: Tmid minimizing the joint fit residual

#pragma once

namespace Statmech {

// Forward declarations
class NASAFitter;
struct ThermoFunctions;
struct NASAFitReport;

/// @brief Abstract interface for Tmid selection strategies
class ITmidSelector {
public:
    virtual ~ITmidSelector() = default;

    /// @brief Choose Tmid for a fit over [Tmin, Tmax]
    /// @param fitter Fitter used to score candidate breakpoints
    /// @param functions Thermo functions being fitted
    /// @param Tmin Lower bound [K]
    /// @param Tmax Upper bound [K]
    /// @param tmid Output: selected breakpoint [K]
    /// @param report Output: candidates examined and iteration count
    /// @return Error code (0 = success, kInvalidFitConfiguration, kFitDidNotConverge)
    virtual int selectTmid(const NASAFitter& fitter,
                           const ThermoFunctions& functions,
                           double Tmin, double Tmax,
                           double& tmid,
                           NASAFitReport& report) const = 0;

    /// @brief Get selector name for logging
    virtual const char* getSelectorName() const = 0;
};

} // namespace Statmech
