#pragma once

#include <array>

namespace Statmech {

// Tolerance indices
enum ToleranceIndex {
    kTolFitResidual = 0,       // RMS of Cp/R, H/RT, S/R deviations over the fit samples
    kTolTmidTie = 1,           // Relative residual difference treated as a Tmid tie
    kTolTmidStep = 2,          // Tmid search bracket width at convergence [K]
    kTolContinuity = 3,        // Relative H/S mismatch allowed at Tmid
    kTolNegativeCp = 4,        // Slack below zero before Cp is non-physical [J/(mol·K)]
    kTolSingularPivot = 5      // Relative pivot threshold of the fit system
};

constexpr int kNumTolerances = 6;

struct Tolerances {
    std::array<double, kNumTolerances> values;

    Tolerances() {
        initDefaults();
    }

    void initDefaults() {
        values[kTolFitResidual] = 5.0e-2;
        values[kTolTmidTie] = 1.0e-2;
        values[kTolTmidStep] = 1.0;
        values[kTolContinuity] = 1.0e-6;
        values[kTolNegativeCp] = 1.0e-9;
        values[kTolSingularPivot] = 1.0e-14;
    }

    double& operator[](int index) { return values[index]; }
    const double& operator[](int index) const { return values[index]; }
};

} // namespace Statmech
