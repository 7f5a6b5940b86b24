#pragma once

#include "../models/SpeciesRecord.hpp"
#include "../postprocess/ThermoTable.hpp"
#include "../solver/NASAFitter.hpp"
#include "../solver/ThermoEvaluator.hpp"
#include "../util/Tolerances.hpp"

namespace Statmech {

/// Per-species working state
/// The loaded record, the prepared evaluator and the products of the last fit
struct SpeciesState {
    SpeciesRecord record;               ///< Loaded species record
    bool lRecordLoaded = false;         ///< Record parsed and stored

    ThermoEvaluator evaluator;          ///< Prepared from record.conformer
    bool lEvaluatorPrepared = false;    ///< evaluator matches record

    NASAFitReport fitReport;            ///< Diagnostics of the last fit
    ThermoTable table;                  ///< Rendering of record.thermo
    bool lFitAvailable = false;         ///< record.thermo holds a fit of this run

    // Tolerances
    Tolerances tolerances;

    /// Drop evaluator and fit products, keep the record
    void resetFit();

    /// Drop the record and the fit products, keep the tolerances
    void clearRecord();

    /// Reset everything including the record
    void reset();
};

} // namespace Statmech
