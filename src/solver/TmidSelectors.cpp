#include "statmech/solver/TmidSelectors.hpp"
#include "statmech/solver/NASAFitter.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace Statmech {

int FixedTmidSelector::selectTmid(const NASAFitter& /*fitter*/,
                                  const ThermoFunctions& /*functions*/,
                                  double Tmin, double Tmax,
                                  double& tmid,
                                  NASAFitReport& report) const {
    int info = NASAFitter::checkRange(Tmin, dTmid_, Tmax);
    if (info != 0) {
        return info;
    }
    tmid = dTmid_;
    report.nIterations = 0;
    return ErrorCode::kSuccess;
}

SearchTmidSelector::SearchTmidSelector(int nCandidates, int maxIterations,
                                       const Tolerances& tolerances)
    : nCandidates_(std::max(nCandidates, 1))
    , nMaxIterations_(maxIterations)
    , tolerances_(tolerances)
{
}

int SearchTmidSelector::selectTmid(const NASAFitter& fitter,
                                   const ThermoFunctions& functions,
                                   double Tmin, double Tmax,
                                   double& tmid,
                                   NASAFitReport& report) const {
    if (NASAFitter::checkRange(Tmin, 0.5 * (Tmin + Tmax), Tmax) != 0) {
        return ErrorCode::kInvalidFitConfiguration;
    }

    const bool verbose = fitter.getPrintMode() > 1;
    auto score = [&](double t) {
        NASA trial;
        double residual = 0.0;
        int info = fitter.fitWithTmid(functions, Tmin, t, Tmax, trial, residual);
        if (info != 0) {
            residual = std::numeric_limits<double>::infinity();
        }
        report.candidates.emplace_back(t, residual);
        if (verbose) {
            std::cerr << "[SearchTmidSelector] Tmid = " << t << " K, residual = " << residual
                      << std::endl;
        }
        return residual;
    };

    // Coarse grid
    const double spacing = (Tmax - Tmin) / (nCandidates_ + 1);
    int best = -1;
    double bestResidual = std::numeric_limits<double>::infinity();
    for (int i = 1; i <= nCandidates_; ++i) {
        double r = score(Tmin + spacing * i);
        if (r < bestResidual) {
            bestResidual = r;
            best = i;
        }
    }
    if (best < 0) {
        if (fitter.getPrintMode() > 0) {
            std::cerr << "[SearchTmidSelector] No candidate breakpoint produced a fit" << std::endl;
        }
        return ErrorCode::kFitDidNotConverge;
    }

    // Golden-section refinement inside the neighbouring grid points
    const double invPhi = 0.5 * (std::sqrt(5.0) - 1.0);
    double a = Tmin + spacing * (best - 1);
    double b = Tmin + spacing * (best + 1);
    double c = b - invPhi * (b - a);
    double d = a + invPhi * (b - a);
    double fc = score(c);
    double fd = score(d);
    int iterations = 0;
    while (b - a > tolerances_[kTolTmidStep]) {
        if (iterations >= nMaxIterations_) {
            report.nIterations = iterations;
            if (fitter.getPrintMode() > 0) {
                std::cerr << "[SearchTmidSelector] Tmid bracket [" << a << ", " << b
                          << "] K did not shrink below " << tolerances_[kTolTmidStep]
                          << " K in " << nMaxIterations_ << " iterations" << std::endl;
            }
            return ErrorCode::kFitDidNotConverge;
        }
        ++iterations;
        if (fc < fd) {
            b = d;
            d = c;
            fd = fc;
            c = b - invPhi * (b - a);
            fc = score(c);
        } else {
            a = c;
            c = d;
            fc = fd;
            d = a + invPhi * (b - a);
            fd = score(d);
        }
    }
    report.nIterations = iterations;

    // Near-ties go to the breakpoint closest to the middle of the range
    for (const auto& candidate : report.candidates) {
        bestResidual = std::min(bestResidual, candidate.second);
    }
    const double middle = 0.5 * (Tmin + Tmax);
    const double tieLimit = bestResidual * (1.0 + tolerances_[kTolTmidTie]);
    bool found = false;
    for (const auto& candidate : report.candidates) {
        if (candidate.second > tieLimit) continue;
        if (!found || std::abs(candidate.first - middle) < std::abs(tmid - middle)) {
            tmid = candidate.first;
            found = true;
        }
    }
    return ErrorCode::kSuccess;
}

} // namespace Statmech
