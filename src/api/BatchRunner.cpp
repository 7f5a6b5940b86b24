#include "statmech/BatchRunner.hpp"
#include "statmech/SpeciesThermo.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <exception>
#include <iomanip>
#include <iostream>

namespace Statmech {

namespace {

void configure(SpeciesThermo& species, const SpeciesIO& settings, const Tolerances& tolerances) {
    SpeciesIO& io = *species.getContext().io;
    io = settings;
    io.resetOutputs();
    // Species output would interleave across threads; the batch logs instead
    io.iPrintResultsMode = 0;
    species.getContext().species->tolerances = tolerances;
}

int load(SpeciesThermo& species, const std::string& filename) {
    return species.loadRecord(filename);
}

int load(SpeciesThermo& species, const SpeciesRecord& record) {
    species.setRecord(record);
    return ErrorCode::kSuccess;
}

std::string sourceName(const std::string& filename) { return filename; }

std::string sourceName(const SpeciesRecord& record) { return record.label; }

template <typename Source>
BatchOutcome runOne(const Source& source, const SpeciesIO& settings,
                    const Tolerances& tolerances) {
    BatchOutcome outcome;
    outcome.cSource = sourceName(source);

    try {
        SpeciesThermo species;
        configure(species, settings, tolerances);

        int info = load(species, source);
        if (info == 0) {
            info = species.calculate();
        }

        outcome.label = species.getRecord().label;
        outcome.iCode = info;
        outcome.cDetail = species.getInfoDetail();
        if (species.getContext().species->lFitAvailable) {
            outcome.thermo = *species.getNASA();
            outcome.dTmid = species.getFitReport().dTmid;
            outcome.dResidual = species.getFitReport().dResidual;
        }
    } catch (const std::exception& e) {
        outcome.iCode = ErrorCode::kUnexpectedError;
        outcome.cDetail = e.what();
        outcome.thermo.reset();
    }

    outcome.cMessage = ErrorCode::getMessage(outcome.iCode);
    return outcome;
}

} // namespace

template <typename Source>
std::vector<BatchOutcome> BatchRunner::runAll(const std::vector<Source>& sources) const {
    const int nSources = static_cast<int>(sources.size());
    std::vector<BatchOutcome> outcomes(sources.size());

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < nSources; ++i) {
        outcomes[i] = runOne(sources[i], settings_, tolerances_);

        if (settings_.iPrintResultsMode > 1) {
            #pragma omp critical(batch_log)
            {
                std::cerr << "[BatchRunner] " << outcomes[i].cSource << ": "
                          << outcomes[i].cMessage;
                if (!outcomes[i].cDetail.empty()) {
                    std::cerr << " (" << outcomes[i].cDetail << ")";
                }
                std::cerr << std::endl;
            }
        }
    }
    return outcomes;
}

std::vector<BatchOutcome> BatchRunner::run(const std::vector<std::string>& filenames) const {
    return runAll(filenames);
}

std::vector<BatchOutcome> BatchRunner::run(const std::vector<SpeciesRecord>& records) const {
    return runAll(records);
}

int BatchRunner::countFailures(const std::vector<BatchOutcome>& outcomes) {
    int nFailures = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.isSuccess()) {
            ++nFailures;
        }
    }
    return nFailures;
}

void BatchRunner::printSummary(const std::vector<BatchOutcome>& outcomes) {
    std::cout << "\n========================================\n";
    std::cout << "           BATCH SUMMARY\n";
    std::cout << "========================================\n";

    for (const auto& outcome : outcomes) {
        std::cout << "  " << std::setw(24) << std::left
                  << (outcome.label.empty() ? outcome.cSource : outcome.label);
        if (outcome.hasModel()) {
            std::cout << " Tmid = " << std::right << std::fixed << std::setprecision(1)
                      << std::setw(7) << outcome.dTmid << " K, residual = "
                      << std::scientific << std::setprecision(3) << outcome.dResidual;
        }
        std::cout << (outcome.isSuccess() ? "  OK" : "  FAILED") << "\n";
    }

    int nFailures = countFailures(outcomes);
    std::cout << "\n" << outcomes.size() - nFailures << "/" << outcomes.size()
              << " species succeeded\n";

    if (nFailures > 0) {
        std::cout << "\nErrors:\n";
        for (const auto& outcome : outcomes) {
            if (outcome.isSuccess()) {
                continue;
            }
            std::cout << "  " << outcome.cSource << ": [" << outcome.iCode << "] "
                      << outcome.cMessage;
            if (!outcome.cDetail.empty()) {
                std::cout << " (" << outcome.cDetail << ")";
            }
            std::cout << "\n";
        }
    }
    std::cout << "========================================\n\n";
}

} // namespace Statmech
