/// @file NASAFitter.hpp
/// @brief Two-range NASA polynomial fit of continuous thermo functions
/// @details Stage 1 fits a1..a5 of both ranges jointly to sampled Cp/R in a
/// single least-squares problem with Cp and dCp/dT continuity at Tmid as
/// equality constraints. Each range is fitted in tau = (T - centre)/halfWidth,
/// the constraints are eliminated through their null space and the reduced
/// design matrix is solved by column-pivoting QR; the result is then mapped
/// back to powers of T. Stage 2 sets a6/a7:
/// the range containing 298.15 K reproduces H and S there exactly, the other
/// range is made continuous in H and S at Tmid.

#pragma once

#include "statmech/models/NASA.hpp"
#include "statmech/solver/ThermoEvaluator.hpp"
#include "statmech/util/Tolerances.hpp"
#include <utility>
#include <vector>

namespace Statmech {

class ITmidSelector;

/// @brief Diagnostics of a completed fit
struct NASAFitReport {
    double dTmid = 0.0;                                  ///< Selected breakpoint [K]
    double dResidual = 0.0;                              ///< RMS of Cp/R, H/RT, S/R deviations
    double dContinuityError = 0.0;                       ///< Relative mismatch at Tmid
    int nIterations = 0;                                 ///< Tmid refinement iterations
    std::vector<std::pair<double, double>> candidates;   ///< (Tmid, residual) examined
};

class NASAFitter {
public:
    /// @brief Constructor
    /// @param tolerances Fit residual, continuity and pivot tolerances
    /// @param nSamplePoints Samples per polynomial range (endpoints included)
    explicit NASAFitter(const Tolerances& tolerances = Tolerances(),
                        int nSamplePoints = Constants::kDefaultSamplePoints);

    /// @brief Fit with a given breakpoint
    /// @param functions Cp(T), H(T), S(T) in SI units
    /// @param Tmin Lower bound [K]
    /// @param Tmid Breakpoint [K], strictly inside (Tmin, Tmax)
    /// @param Tmax Upper bound [K]
    /// @param model Output: fitted model (E0, Cp0, CpInf left untouched)
    /// @param residual Output: RMS deviation over all samples
    /// @return Error code (0 = success, kInvalidFitConfiguration, kSingularFitSystem,
    ///         kNonPhysicalResult if a sampled function is not finite).
    ///         The residual is not compared against the tolerance here.
    int fitWithTmid(const ThermoFunctions& functions,
                    double Tmin, double Tmid, double Tmax,
                    NASA& model, double& residual) const;

    /// @brief Select Tmid and fit
    /// @param functions Cp(T), H(T), S(T) in SI units
    /// @param Tmin Lower bound [K]
    /// @param Tmax Upper bound [K]
    /// @param selector Breakpoint strategy
    /// @param model Output: fitted model, also returned on kPoorFitQuality
    /// @param report Output: fit diagnostics
    /// @return Error code (0 = success, kPoorFitQuality, kFitDidNotConverge, ...)
    int fit(const ThermoFunctions& functions,
            double Tmin, double Tmax,
            const ITmidSelector& selector,
            NASA& model, NASAFitReport& report) const;

    /// @brief Check Tmin < Tmid < Tmax with Tmin > 0
    /// @return Error code (0 = success, kInvalidFitConfiguration)
    static int checkRange(double Tmin, double Tmid, double Tmax);

    const Tolerances& getTolerances() const { return tolerances_; }
    int getNumSamplePoints() const { return nSamplePoints_; }

    /// @brief Diagnostics level (0 = silent, 2 = per-candidate lines on std::cerr)
    void setPrintMode(int mode) { iPrintMode_ = mode; }
    int getPrintMode() const { return iPrintMode_; }

private:
    Tolerances tolerances_;
    int nSamplePoints_;
    int iPrintMode_ = 0;

    /// @brief Evenly spaced samples over [lo, hi], endpoints included
    std::vector<double> samples(double lo, double hi) const;
};

} // namespace Statmech
