#pragma once

#include <string>
#include "../util/Constants.hpp"

namespace Statmech {

/// Input/Output state
/// Bridge between external callers and the per-species pipeline
struct SpeciesIO {
    // Input variables
    int iPrintResultsMode = 0;          ///< Print results mode (0=none, 1=summary, 2=detailed)

    double dTmin = Constants::kDefaultTmin;        ///< Lower fit temperature [K]
    double dTmax = Constants::kDefaultTmax;        ///< Upper fit temperature [K]
    double dTmid = Constants::kDefaultTmid;        ///< Fixed breakpoint [K]
    double dPressure = Constants::kReferencePressure;  ///< Standard-state pressure [Pa]

    int nTmidCandidates = Constants::kDefaultTmidCandidates;     ///< Search grid size
    int nMaxFitIterations = Constants::kDefaultMaxFitIterations; ///< Refinement budget
    int nSamplePoints = Constants::kDefaultSamplePoints;         ///< Samples per range
    int nTorsionBasis = Constants::kDefaultTorsionBasis;         ///< Quantum rotor half-width

    std::string cRecordFileName;        ///< Species record path
    std::string cOutputFilePath;        ///< Output directory for rewritten records

    // Control flags
    bool lTmidSearch = false;           ///< Search for Tmid instead of using dTmid
    bool lWriteRecord = false;          ///< Write the refitted record after a fit

    // Output variables
    int INFOSpecies = 0;                ///< Status/error code
    std::string cInfoDetail;            ///< Offending mode/field of the last failure
    double dTmidOut = 0.0;              ///< Breakpoint of the fitted model [K]
    double dFitResidual = 0.0;          ///< RMS fit residual
    double dContinuityError = 0.0;      ///< Relative H/S mismatch at Tmid
    int nFitIterations = 0;             ///< Tmid refinement iterations
    double dH298 = 0.0;                 ///< Enthalpy at 298.15 K [kcal/mol]
    double dS298 = 0.0;                 ///< Entropy at 298.15 K [cal/(mol·K)]
    double dCp298 = 0.0;                ///< Heat capacity at 298.15 K [J/(mol·K)]

    /// Path of the rewritten record for a species label
    std::string getOutputRecordPath(const std::string& label) const;

    /// Clear output variables, keep settings
    void resetOutputs();

    /// Reset I/O state
    void reset();
};

} // namespace Statmech
