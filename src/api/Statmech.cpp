#include "statmech/Statmech.hpp"
#include "statmech/parser/YamlRecord.hpp"
#include "statmech/postprocess/ChemkinEntry.hpp"
#include "statmech/solver/TmidSelectors.hpp"
#include "statmech/util/ElementData.hpp"
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace Statmech {

namespace {

// Unit errors thrown by Quantity arithmetic stop at the species boundary
template <typename Step>
void runGuarded(SpeciesContext& ctx, Step step) {
    try {
        step();
    } catch (const UnitMismatchError& e) {
        ctx.setInfoSpecies(ErrorCode::kUnitMismatch, e.what());
    } catch (const UnrecognizedUnitError& e) {
        ctx.setInfoSpecies(ErrorCode::kUnrecognizedUnit, e.what());
    }
}

// A fit with kPoorFitQuality is still a usable model
bool canContinue(const SpeciesContext& ctx) {
    return ctx.io->INFOSpecies == 0 || ctx.io->INFOSpecies == ErrorCode::kPoorFitQuality;
}

std::unique_ptr<ITmidSelector> makeSelector(const SpeciesContext& ctx) {
    const auto& io = *ctx.io;
    if (io.lTmidSearch) {
        return std::make_unique<SearchTmidSelector>(io.nTmidCandidates, io.nMaxFitIterations,
                                                    ctx.species->tolerances);
    }
    return std::make_unique<FixedTmidSelector>(io.dTmid);
}

} // namespace

void statmech(SpeciesContext& ctx) {
    std::unique_ptr<ITmidSelector> selector = makeSelector(ctx);
    statmech(ctx, *selector);
}

void statmech(SpeciesContext& ctx, const ITmidSelector& selector) {
    ctx.resetFit();

    checkRecord(ctx);
    if (ctx.io->INFOSpecies != 0) return;

    prepareEvaluator(ctx);
    if (ctx.io->INFOSpecies != 0) return;

    sampleThermo(ctx);
    if (ctx.io->INFOSpecies != 0) return;

    fitNASA(ctx, selector);
    if (!canContinue(ctx)) return;

    tabulate(ctx);
    if (!canContinue(ctx)) return;

    if (ctx.io->lWriteRecord) {
        int fitInfo = ctx.io->INFOSpecies;
        writeRecord(ctx);
        if (ctx.io->INFOSpecies == 0) {
            ctx.io->INFOSpecies = fitInfo;
        }
    }

    if (ctx.io->iPrintResultsMode > 0) {
        printResults(ctx);
    }
}

void checkRecord(SpeciesContext& ctx) {
    auto& io = *ctx.io;
    auto& species = *ctx.species;

    if (!species.lRecordLoaded) {
        ctx.setInfoSpecies(ErrorCode::kNoConformer, "no species record loaded");
        return;
    }

    // Fit range and breakpoint
    if (!std::isfinite(io.dTmin) || !std::isfinite(io.dTmax) ||
        NASAFitter::checkRange(io.dTmin, io.lTmidSearch ? 0.5 * (io.dTmin + io.dTmax) : io.dTmid,
                               io.dTmax) != 0) {
        ctx.setInfoSpecies(ErrorCode::kInvalidFitConfiguration, "temperature range / Tmid");
        return;
    }
    if (io.nSamplePoints < 2 || io.nTmidCandidates < 1 || io.nMaxFitIterations < 1) {
        ctx.setInfoSpecies(ErrorCode::kInvalidFitConfiguration, "fit sample / iteration settings");
        return;
    }
    if (io.nTorsionBasis < 1) {
        ctx.setInfoSpecies(ErrorCode::kInvalidModeParameter, "torsion basis");
        return;
    }
    if (!(io.dPressure > 0.0)) {
        ctx.setInfoSpecies(ErrorCode::kInvalidFitConfiguration, "standard-state pressure");
        return;
    }

    runGuarded(ctx, [&]() {
        std::string detail;
        int info = species.record.validate(detail);
        if (info != 0) {
            ctx.setInfoSpecies(info, detail);
        }
    });
}

void prepareEvaluator(SpeciesContext& ctx) {
    auto& io = *ctx.io;
    auto& species = *ctx.species;

    if (!species.record.conformer) {
        ctx.setInfoSpecies(ErrorCode::kNoConformer, species.record.label);
        return;
    }

    PartitionSettings settings;
    settings.dFrequencyScaleFactor = species.record.frequencyScaleFactor;
    settings.lUseHinderedRotors = species.record.useHinderedRotors;
    settings.nTorsionBasis = io.nTorsionBasis;
    settings.dPressure = io.dPressure;

    runGuarded(ctx, [&]() {
        species.evaluator = ThermoEvaluator(species.tolerances);
        std::string detail;
        int info = species.evaluator.prepare(*species.record.conformer, settings, detail);
        if (info != 0) {
            ctx.setInfoSpecies(info, detail);
            return;
        }
        species.lEvaluatorPrepared = true;
    });
}

void sampleThermo(SpeciesContext& ctx) {
    auto& io = *ctx.io;
    auto& species = *ctx.species;

    if (!species.lEvaluatorPrepared) {
        ctx.setInfoSpecies(ErrorCode::kNoThermoModel, "evaluator not prepared");
        return;
    }

    // Both fit ranges at the configured density plus the reference temperature
    int nPoints = 2 * io.nSamplePoints;
    std::vector<double> temperatures(nPoints);
    for (int i = 0; i < nPoints; ++i) {
        temperatures[i] = io.dTmin + (io.dTmax - io.dTmin) * i / (nPoints - 1);
    }
    temperatures.push_back(Constants::kStandardTemperature);

    std::vector<ThermoPoint> points;
    std::string detail;
    int info = species.evaluator.sample(temperatures, points, detail);
    if (info != 0) {
        ctx.setInfoSpecies(info, detail);
        return;
    }
    io.dCp298 = points.back().dHeatCapacity;
}

void fitNASA(SpeciesContext& ctx) {
    std::unique_ptr<ITmidSelector> selector = makeSelector(ctx);
    fitNASA(ctx, *selector);
}

void fitNASA(SpeciesContext& ctx, const ITmidSelector& selector) {
    auto& io = *ctx.io;
    auto& species = *ctx.species;

    if (!species.lEvaluatorPrepared) {
        ctx.setInfoSpecies(ErrorCode::kNoThermoModel, "evaluator not prepared");
        return;
    }

    NASAFitter fitter(species.tolerances, io.nSamplePoints);
    fitter.setPrintMode(io.iPrintResultsMode);

    NASA model;
    int info = fitter.fit(species.evaluator.functions(), io.dTmin, io.dTmax, selector,
                          model, species.fitReport);
    if (info != 0 && info != ErrorCode::kPoorFitQuality) {
        ctx.setInfoSpecies(info, selector.getSelectorName());
        return;
    }

    model.dE0 = species.evaluator.getE0();
    model.dCp0 = species.evaluator.getCp0();
    model.dCpInf = species.evaluator.getCpInf();

    species.record.thermo = model;
    species.lFitAvailable = true;

    io.dTmidOut = species.fitReport.dTmid;
    io.dFitResidual = species.fitReport.dResidual;
    io.dContinuityError = species.fitReport.dContinuityError;
    io.nFitIterations = species.fitReport.nIterations;

    if (info == ErrorCode::kPoorFitQuality) {
        ctx.setInfoSpecies(info, "residual " + std::to_string(io.dFitResidual));
    }
}

void tabulate(SpeciesContext& ctx) {
    auto& io = *ctx.io;
    auto& species = *ctx.species;

    if (!species.record.thermo) {
        ctx.setInfoSpecies(ErrorCode::kNoThermoModel, species.record.label);
        return;
    }

    // No H298/S298 for a range that excludes 298.15 K
    if (species.record.thermo->selectPolynomial(Constants::kStandardTemperature) == nullptr) {
        return;
    }

    int info = buildThermoTable(*species.record.thermo, species.table);
    if (info != 0) {
        ctx.setInfoSpecies(info, "thermo table");
        return;
    }
    io.dH298 = species.table.dH298;
    io.dS298 = species.table.dS298;
}

// ============================================================================
// Record Functions
// ============================================================================

void setRecordFileName(SpeciesContext& ctx, const std::string& filename) {
    ctx.io->cRecordFileName = filename;
}

void loadRecord(SpeciesContext& ctx, const std::string& filename) {
    YamlRecordParser parser;
    loadRecord(ctx, filename, parser);
}

void loadRecord(SpeciesContext& ctx) {
    loadRecord(ctx, ctx.io->cRecordFileName);
}

void loadRecord(SpeciesContext& ctx, const std::string& filename, const IRecordParser& parser) {
    ctx.species->clearRecord();
    ctx.io->resetOutputs();
    ctx.io->cRecordFileName = filename;

    SpeciesRecord record;
    std::string detail;
    int info = parser.parse(filename, record, detail);
    if (info != 0) {
        if (ctx.io->iPrintResultsMode > 0) {
            std::cerr << "[" << parser.getParserName() << "] " << filename << ": "
                      << ErrorCode::getMessage(info) << " (" << detail << ")" << std::endl;
        }
        ctx.setInfoSpecies(info, detail);
        return;
    }

    ctx.species->record = std::move(record);
    ctx.species->lRecordLoaded = true;
}

void setRecord(SpeciesContext& ctx, const SpeciesRecord& record) {
    ctx.species->clearRecord();
    ctx.io->resetOutputs();
    ctx.species->record = record;
    ctx.species->lRecordLoaded = true;
}

void writeRecord(SpeciesContext& ctx, const std::string& filename) {
    YamlRecordWriter writer;
    writeRecord(ctx, filename, writer);
}

void writeRecord(SpeciesContext& ctx) {
    writeRecord(ctx, ctx.io->getOutputRecordPath(ctx.species->record.label));
}

void writeRecord(SpeciesContext& ctx, const std::string& filename, const IRecordWriter& writer) {
    if (!ctx.species->lRecordLoaded) {
        ctx.setInfoSpecies(ErrorCode::kNoConformer, "no species record loaded");
        return;
    }

    std::string detail;
    int info = writer.write(ctx.species->record, filename, detail);
    if (info != 0) {
        if (ctx.io->iPrintResultsMode > 0) {
            std::cerr << "[" << writer.getWriterName() << "] " << filename << ": "
                      << ErrorCode::getMessage(info) << std::endl;
        }
        ctx.setInfoSpecies(info, detail);
    }
}

// ============================================================================
// Input Setting Functions
// ============================================================================

void setTemperatureRange(SpeciesContext& ctx, double Tmin, double Tmax) {
    ctx.io->dTmin = Tmin;
    ctx.io->dTmax = Tmax;
}

void setTmid(SpeciesContext& ctx, double Tmid) {
    ctx.io->dTmid = Tmid;
    ctx.io->lTmidSearch = false;
}

void setTmidSearch(SpeciesContext& ctx, bool enable) {
    ctx.io->lTmidSearch = enable;
}

void setTmidCandidates(SpeciesContext& ctx, int nCandidates) {
    ctx.io->nTmidCandidates = nCandidates;
}

void setMaxFitIterations(SpeciesContext& ctx, int maxIter) {
    ctx.io->nMaxFitIterations = maxIter;
}

void setSamplePoints(SpeciesContext& ctx, int nPoints) {
    ctx.io->nSamplePoints = nPoints;
}

void setTorsionBasis(SpeciesContext& ctx, int halfWidth) {
    ctx.io->nTorsionBasis = halfWidth;
}

void setPressure(SpeciesContext& ctx, double pressure) {
    ctx.io->dPressure = pressure;
}

void setPrintResultsMode(SpeciesContext& ctx, int mode) {
    ctx.io->iPrintResultsMode = mode;
}

void setOutputFilePath(SpeciesContext& ctx, const std::string& path) {
    ctx.io->cOutputFilePath = path;
}

void setWriteRecord(SpeciesContext& ctx, bool enable) {
    ctx.io->lWriteRecord = enable;
}

void setTolerance(SpeciesContext& ctx, int index, double value) {
    if (index >= 0 && index < kNumTolerances) {
        ctx.species->tolerances[index] = value;
    }
}

// ============================================================================
// Output Retrieval Functions
// ============================================================================

std::pair<double, int> getHeatCapacity(const SpeciesContext& ctx, double T) {
    if (!ctx.species->lEvaluatorPrepared) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    return ctx.species->evaluator.getHeatCapacity(T);
}

std::pair<double, int> getEnthalpy(const SpeciesContext& ctx, double T) {
    if (!ctx.species->lEvaluatorPrepared) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    return ctx.species->evaluator.getEnthalpy(T);
}

std::pair<double, int> getEntropy(const SpeciesContext& ctx, double T) {
    if (!ctx.species->lEvaluatorPrepared) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    return ctx.species->evaluator.getEntropy(T);
}

std::pair<double, int> getGibbsEnergy(const SpeciesContext& ctx, double T) {
    if (!ctx.species->lEvaluatorPrepared) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    ThermoPoint point;
    int info = ctx.species->evaluator.evaluate(T, point);
    return {point.dGibbsEnergy, info};
}

std::pair<double, int> getFittedHeatCapacity(const SpeciesContext& ctx, double T) {
    const auto& thermo = ctx.species->record.thermo;
    if (!thermo) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    return thermo->getHeatCapacity(T);
}

std::pair<double, int> getFittedEnthalpy(const SpeciesContext& ctx, double T) {
    const auto& thermo = ctx.species->record.thermo;
    if (!thermo) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    return thermo->getEnthalpy(T);
}

std::pair<double, int> getFittedEntropy(const SpeciesContext& ctx, double T) {
    const auto& thermo = ctx.species->record.thermo;
    if (!thermo) {
        return {0.0, ErrorCode::kNoThermoModel};
    }
    return thermo->getEntropy(T);
}

std::pair<double, int> getAverageDownwardEnergy(const SpeciesContext& ctx, double T) {
    const auto& model = ctx.species->record.energyTransfer;
    if (!model) {
        return {0.0, ErrorCode::kInvalidEnergyTransfer};
    }
    try {
        auto [energy, info] = model->averageDownwardEnergy(T);
        if (info != 0) {
            return {0.0, info};
        }
        return {energy.valueIn("J/mol"), ErrorCode::kSuccess};
    } catch (const UnitMismatchError&) {
        return {0.0, ErrorCode::kUnitMismatch};
    } catch (const UnrecognizedUnitError&) {
        return {0.0, ErrorCode::kUnrecognizedUnit};
    }
}

std::string getChemkinEntry(const SpeciesContext& ctx) {
    const auto& record = ctx.species->record;
    if (!record.thermo) {
        return "";
    }
    std::map<std::string, int> elements;
    if (record.conformer) {
        elements = countElements(record.conformer->atomicNumbers);
    }
    std::string entry;
    if (writeChemkinEntry(record.label, elements, *record.thermo, entry) != 0 &&
        ctx.io->iPrintResultsMode > 0) {
        std::cerr << "[Chemkin] " << record.label << ": " << elements.size()
                  << " elements do not fit the 4-slot header" << std::endl;
    }
    return entry;
}

void resetFit(SpeciesContext& ctx) {
    ctx.resetFit();
}

void resetAll(SpeciesContext& ctx) {
    ctx.resetAll();
}

const char* getErrorMessage(int errorCode) {
    return ErrorCode::getMessage(errorCode);
}

} // namespace Statmech
