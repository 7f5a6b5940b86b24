#include "statmech/SpeciesContext.hpp"

namespace Statmech {

void SpeciesState::resetFit() {
    evaluator = ThermoEvaluator(tolerances);
    lEvaluatorPrepared = false;
    fitReport = NASAFitReport();
    table = ThermoTable();
    lFitAvailable = false;
}

void SpeciesState::clearRecord() {
    record = SpeciesRecord();
    lRecordLoaded = false;
    resetFit();
}

void SpeciesState::reset() {
    clearRecord();
    tolerances.initDefaults();
}

SpeciesContext::SpeciesContext()
    : species(std::make_unique<SpeciesState>())
    , io(std::make_unique<SpeciesIO>())
{
}

SpeciesContext::~SpeciesContext() = default;

SpeciesContext::SpeciesContext(SpeciesContext&&) noexcept = default;

SpeciesContext& SpeciesContext::operator=(SpeciesContext&&) noexcept = default;

void SpeciesContext::resetFit() {
    // Keep the record and the settings
    io->resetOutputs();
    species->resetFit();
}

void SpeciesContext::resetAll() {
    species->reset();
    io->reset();
}

} // namespace Statmech
