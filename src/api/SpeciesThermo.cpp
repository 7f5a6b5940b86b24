/// @file SpeciesThermo.cpp
/// @brief Implementation of the species class API

#include "statmech/SpeciesThermo.hpp"
#include "statmech/Statmech.hpp"

// Interface headers (needed for unique_ptr destruction)
#include "statmech/interfaces/IRecordParser.hpp"
#include "statmech/interfaces/ITmidSelector.hpp"

#include "statmech/parser/YamlRecord.hpp"

namespace Statmech {

SpeciesThermo::SpeciesThermo()
    : state_(context_.species.get()),
      io_(context_.io.get()),
      parser_(std::make_unique<YamlRecordParser>()),
      writer_(std::make_unique<YamlRecordWriter>()) {
}

SpeciesThermo::~SpeciesThermo() = default;

SpeciesThermo::SpeciesThermo(SpeciesThermo&& other) noexcept
    : context_(std::move(other.context_)),
      state_(context_.species.get()),
      io_(context_.io.get()),
      parser_(std::move(other.parser_)),
      writer_(std::move(other.writer_)),
      selector_(std::move(other.selector_)) {
}

SpeciesThermo& SpeciesThermo::operator=(SpeciesThermo&& other) noexcept {
    if (this != &other) {
        context_ = std::move(other.context_);
        state_ = context_.species.get();
        io_ = context_.io.get();
        parser_ = std::move(other.parser_);
        writer_ = std::move(other.writer_);
        selector_ = std::move(other.selector_);
    }
    return *this;
}

// =========================================================================
// Record Loading
// =========================================================================

int SpeciesThermo::loadRecord(const std::string& filename) {
    Statmech::loadRecord(context_, filename, *parser_);
    return context_.infoSpecies();
}

void SpeciesThermo::setRecord(const SpeciesRecord& record) {
    Statmech::setRecord(context_, record);
}

int SpeciesThermo::writeRecord(const std::string& filename) {
    if (!context_.isRecordLoaded()) {
        return ErrorCode::kNoConformer;
    }
    std::string detail;
    int info = writer_->write(state_->record, filename, detail);
    if (info != 0) {
        context_.setInfoSpecies(info, detail);
    }
    return info;
}

void SpeciesThermo::setParser(std::unique_ptr<IRecordParser> parser) {
    if (parser) {
        parser_ = std::move(parser);
    }
}

void SpeciesThermo::setWriter(std::unique_ptr<IRecordWriter> writer) {
    if (writer) {
        writer_ = std::move(writer);
    }
}

// =========================================================================
// Input Configuration
// =========================================================================

void SpeciesThermo::setTemperatureRange(double Tmin, double Tmax) {
    Statmech::setTemperatureRange(context_, Tmin, Tmax);
}

void SpeciesThermo::setTmid(double Tmid) {
    Statmech::setTmid(context_, Tmid);
}

void SpeciesThermo::setTmidSearch(bool enable) {
    Statmech::setTmidSearch(context_, enable);
}

void SpeciesThermo::setTmidCandidates(int nCandidates) {
    Statmech::setTmidCandidates(context_, nCandidates);
}

void SpeciesThermo::setMaxFitIterations(int maxIter) {
    Statmech::setMaxFitIterations(context_, maxIter);
}

void SpeciesThermo::setSamplePoints(int nPoints) {
    Statmech::setSamplePoints(context_, nPoints);
}

void SpeciesThermo::setTorsionBasis(int halfWidth) {
    Statmech::setTorsionBasis(context_, halfWidth);
}

void SpeciesThermo::setPressure(double pressure) {
    Statmech::setPressure(context_, pressure);
}

void SpeciesThermo::setPrintResultsMode(int mode) {
    Statmech::setPrintResultsMode(context_, mode);
}

void SpeciesThermo::setOutputFilePath(const std::string& path) {
    Statmech::setOutputFilePath(context_, path);
}

void SpeciesThermo::setWriteRecord(bool enable) {
    Statmech::setWriteRecord(context_, enable);
}

void SpeciesThermo::setTolerance(int index, double value) {
    Statmech::setTolerance(context_, index, value);
}

void SpeciesThermo::setTmidSelector(std::unique_ptr<ITmidSelector> selector) {
    selector_ = std::move(selector);
}

// =========================================================================
// Main Computation
// =========================================================================

int SpeciesThermo::calculate() {
    if (selector_) {
        Statmech::statmech(context_, *selector_);
    } else {
        Statmech::statmech(context_);
    }
    return context_.infoSpecies();
}

// =========================================================================
// Output Retrieval
// =========================================================================

std::pair<double, int> SpeciesThermo::getHeatCapacity(double T) const {
    return Statmech::getHeatCapacity(context_, T);
}

std::pair<double, int> SpeciesThermo::getEnthalpy(double T) const {
    return Statmech::getEnthalpy(context_, T);
}

std::pair<double, int> SpeciesThermo::getEntropy(double T) const {
    return Statmech::getEntropy(context_, T);
}

std::pair<double, int> SpeciesThermo::getGibbsEnergy(double T) const {
    return Statmech::getGibbsEnergy(context_, T);
}

std::pair<double, int> SpeciesThermo::getFittedHeatCapacity(double T) const {
    return Statmech::getFittedHeatCapacity(context_, T);
}

std::pair<double, int> SpeciesThermo::getFittedEnthalpy(double T) const {
    return Statmech::getFittedEnthalpy(context_, T);
}

std::pair<double, int> SpeciesThermo::getFittedEntropy(double T) const {
    return Statmech::getFittedEntropy(context_, T);
}

std::pair<double, int> SpeciesThermo::getAverageDownwardEnergy(double T) const {
    return Statmech::getAverageDownwardEnergy(context_, T);
}

const NASA* SpeciesThermo::getNASA() const {
    return state_->record.thermo ? &*state_->record.thermo : nullptr;
}

std::string SpeciesThermo::getChemkinEntry() const {
    return Statmech::getChemkinEntry(context_);
}

// =========================================================================
// Status
// =========================================================================

void SpeciesThermo::printResults() const {
    Statmech::printResults(context_);
}

void SpeciesThermo::resetFit() {
    context_.resetFit();
}

void SpeciesThermo::reset() {
    context_.resetAll();
}

} // namespace Statmech
