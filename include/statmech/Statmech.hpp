#pragma once

#include "SpeciesContext.hpp"
#include "util/Constants.hpp"
#include "util/ErrorCodes.hpp"
#include "util/Tolerances.hpp"

#include <string>
#include <utility>

namespace Statmech {

class IRecordParser;
class IRecordWriter;
class ITmidSelector;

// ============================================================================
// Main Pipeline Functions
// ============================================================================

/// Main entry point - evaluates the loaded record and fits its NASA model
/// Runs checkRecord, prepareEvaluator, sampleThermo, fitNASA, tabulate and,
/// when enabled, writeRecord. Stops at the first failing step except
/// kPoorFitQuality, which keeps the fitted model.
void statmech(SpeciesContext& ctx);

/// Same as statmech(ctx) with an explicit Tmid selection strategy
void statmech(SpeciesContext& ctx, const ITmidSelector& selector);

/// Validate the loaded record and the run settings
void checkRecord(SpeciesContext& ctx);

/// Build the partition-function evaluator from the record conformer
void prepareEvaluator(SpeciesContext& ctx);

/// Sample Cp, H, S over [Tmin, Tmax] and reject non-physical values
void sampleThermo(SpeciesContext& ctx);

/// Fit the NASA model, Tmid chosen from the settings
void fitNASA(SpeciesContext& ctx);

/// Fit the NASA model with an explicit Tmid selection strategy
void fitNASA(SpeciesContext& ctx, const ITmidSelector& selector);

/// Render the fitted model as the Cp/H298/S298 table
void tabulate(SpeciesContext& ctx);

// ============================================================================
// Record Functions
// ============================================================================

/// Set the species record filename
void setRecordFileName(SpeciesContext& ctx, const std::string& filename);

/// Load a YAML species record
void loadRecord(SpeciesContext& ctx, const std::string& filename);

/// Load using filename set in context
void loadRecord(SpeciesContext& ctx);

/// Load a record with an explicit reader
void loadRecord(SpeciesContext& ctx, const std::string& filename, const IRecordParser& parser);

/// Use an in-memory record
void setRecord(SpeciesContext& ctx, const SpeciesRecord& record);

/// Write the record, with its fitted model, to filename
void writeRecord(SpeciesContext& ctx, const std::string& filename);

/// Write the record to the output directory as <label>.yml
void writeRecord(SpeciesContext& ctx);

/// Write the record with an explicit writer
void writeRecord(SpeciesContext& ctx, const std::string& filename, const IRecordWriter& writer);

// ============================================================================
// Input Setting Functions
// ============================================================================

/// Set fit temperature range [K]
void setTemperatureRange(SpeciesContext& ctx, double Tmin, double Tmax);

/// Set fixed breakpoint [K] (disables Tmid search)
void setTmid(SpeciesContext& ctx, double Tmid);

/// Enable/disable Tmid search
void setTmidSearch(SpeciesContext& ctx, bool enable);

/// Set number of Tmid candidates scored by the search
void setTmidCandidates(SpeciesContext& ctx, int nCandidates);

/// Set iteration budget of the Tmid refinement
void setMaxFitIterations(SpeciesContext& ctx, int maxIter);

/// Set number of fit samples per polynomial range
void setSamplePoints(SpeciesContext& ctx, int nPoints);

/// Set quantum rotor basis half-width (2M+1 basis functions)
void setTorsionBasis(SpeciesContext& ctx, int halfWidth);

/// Set standard-state pressure [Pa]
void setPressure(SpeciesContext& ctx, double pressure);

/// Set print results mode (0=none, 1=summary, 2=detailed)
void setPrintResultsMode(SpeciesContext& ctx, int mode);

/// Set output directory for rewritten records
void setOutputFilePath(SpeciesContext& ctx, const std::string& path);

/// Enable/disable writing the record after a fit
void setWriteRecord(SpeciesContext& ctx, bool enable);

/// Set a tolerance by index (see ToleranceIndex)
void setTolerance(SpeciesContext& ctx, int index, double value);

// ============================================================================
// Output Retrieval Functions
// ============================================================================

/// Statistical-mechanics heat capacity [J/(mol·K)]
/// Returns (Cp, info) where info=0 on success
std::pair<double, int> getHeatCapacity(const SpeciesContext& ctx, double T);

/// Statistical-mechanics enthalpy including E0 [J/mol]
std::pair<double, int> getEnthalpy(const SpeciesContext& ctx, double T);

/// Statistical-mechanics entropy [J/(mol·K)]
std::pair<double, int> getEntropy(const SpeciesContext& ctx, double T);

/// Statistical-mechanics Gibbs energy [J/mol]
std::pair<double, int> getGibbsEnergy(const SpeciesContext& ctx, double T);

/// Heat capacity of the fitted NASA model [J/(mol·K)]
std::pair<double, int> getFittedHeatCapacity(const SpeciesContext& ctx, double T);

/// Enthalpy of the fitted NASA model [J/mol]
std::pair<double, int> getFittedEnthalpy(const SpeciesContext& ctx, double T);

/// Entropy of the fitted NASA model [J/(mol·K)]
std::pair<double, int> getFittedEntropy(const SpeciesContext& ctx, double T);

/// Average downward energy of the collision model [J/mol]
std::pair<double, int> getAverageDownwardEnergy(const SpeciesContext& ctx, double T);

/// Chemkin entry of the fitted model (empty if none, or if the elements exceed the 4 header slots)
std::string getChemkinEntry(const SpeciesContext& ctx);

// ============================================================================
// Output Functions
// ============================================================================

/// Print species summary to stdout
void printResults(const SpeciesContext& ctx);

/// Reset fit state (keeps record and settings)
void resetFit(SpeciesContext& ctx);

/// Full reset
void resetAll(SpeciesContext& ctx);

// ============================================================================
// Utility Functions
// ============================================================================

/// Get error message for error code
const char* getErrorMessage(int errorCode);

} // namespace Statmech
