/// @file TmidSelectors.hpp
/// @brief Breakpoint strategies for the NASA fit

#pragma once

#include "statmech/interfaces/ITmidSelector.hpp"
#include "statmech/util/Constants.hpp"
#include "statmech/util/Tolerances.hpp"

namespace Statmech {

/// @brief Use a fixed breakpoint
class FixedTmidSelector : public ITmidSelector {
public:
    explicit FixedTmidSelector(double tmid = Constants::kDefaultTmid) : dTmid_(tmid) {}

    int selectTmid(const NASAFitter& fitter,
                   const ThermoFunctions& functions,
                   double Tmin, double Tmax,
                   double& tmid,
                   NASAFitReport& report) const override;

    const char* getSelectorName() const override { return "FixedTmidSelector"; }

private:
    double dTmid_;
};

/// @brief Search the breakpoint minimizing the joint fit residual
/// @details Scores an evenly spaced interior candidate grid, then refines the
/// bracket around the best candidate by golden-section search until it is
/// narrower than the step tolerance. Among all breakpoints examined, those
/// whose residual is within the tie tolerance of the best are considered
/// equivalent and the one closest to the middle of [Tmin, Tmax] wins.
class SearchTmidSelector : public ITmidSelector {
public:
    /// @brief Constructor
    /// @param nCandidates Interior grid points
    /// @param maxIterations Refinement budget
    /// @param tolerances Tie and step tolerances
    SearchTmidSelector(int nCandidates = Constants::kDefaultTmidCandidates,
                       int maxIterations = Constants::kDefaultMaxFitIterations,
                       const Tolerances& tolerances = Tolerances());

    int selectTmid(const NASAFitter& fitter,
                   const ThermoFunctions& functions,
                   double Tmin, double Tmax,
                   double& tmid,
                   NASAFitReport& report) const override;

    const char* getSelectorName() const override { return "SearchTmidSelector"; }

private:
    int nCandidates_;
    int nMaxIterations_;
    Tolerances tolerances_;
};

} // namespace Statmech
