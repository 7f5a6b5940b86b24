/// @file batch_fit.cpp
/// @brief Batch NASA refit of species records
/// @details Loads each record, evaluates its partition function, fits the NASA
/// model and optionally writes the refitted record.
///
/// Usage: statmech_batch <record.yml>... [--tmid-search] [--tmin T] [--tmax T]
///                       [--tmid T] [--output-dir DIR] [--print N]

#include "statmech/BatchRunner.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Statmech;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <record.yml>... [--tmid-search] [--tmin T] [--tmax T] [--tmid T]"
                 " [--output-dir DIR] [--print N]" << std::endl;
    std::cerr << "\nFits a NASA model to each species record and reports per-species errors."
              << std::endl;
    std::cerr << "With --output-dir, refitted records are written to DIR/<label>.yml"
              << std::endl;
}

/// @brief Value following a flag, advancing the index
std::string flagValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> records;
    SpeciesIO settings;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--tmid-search") {
                settings.lTmidSearch = true;
            } else if (arg == "--tmin") {
                settings.dTmin = std::stod(flagValue(argc, argv, i));
            } else if (arg == "--tmax") {
                settings.dTmax = std::stod(flagValue(argc, argv, i));
            } else if (arg == "--tmid") {
                settings.dTmid = std::stod(flagValue(argc, argv, i));
            } else if (arg == "--output-dir") {
                settings.cOutputFilePath = flagValue(argc, argv, i);
                settings.lWriteRecord = true;
            } else if (arg == "--print") {
                settings.iPrintResultsMode = std::stoi(flagValue(argc, argv, i));
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
                throw std::invalid_argument("unknown option " + arg);
            } else {
                records.push_back(arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: value out of range (" << e.what() << ")\n" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (records.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "Fitting " << records.size() << " species record(s)..." << std::endl;

    BatchRunner runner(settings);
    std::vector<BatchOutcome> outcomes = runner.run(records);

    BatchRunner::printSummary(outcomes);

    return BatchRunner::countFailures(outcomes) == 0 ? 0 : 1;
}
