/// @file BatchRunner.hpp
/// @brief Independent pipeline runs over many species
/// @details Species are processed in an OpenMP parallel loop, each with its
/// own SpeciesThermo. Outcomes are returned in input order; a failing species
/// never stops the others.

#pragma once

#include "statmech/context/SpeciesIO.hpp"
#include "statmech/models/SpeciesRecord.hpp"
#include "statmech/util/Tolerances.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Statmech {

/// @brief Result of one species in a batch
struct BatchOutcome {
    std::string cSource;            ///< Record file name, or label for in-memory records
    std::string label;              ///< Species label ("" if the record did not load)
    int iCode = 0;                  ///< Error code of the pipeline
    std::string cMessage;           ///< ErrorCode::getMessage(iCode)
    std::string cDetail;            ///< Offending mode/field
    std::optional<NASA> thermo;     ///< Fitted model (also kept for kPoorFitQuality)
    double dTmid = 0.0;             ///< [K]
    double dResidual = 0.0;

    bool isSuccess() const { return iCode == 0; }

    /// @brief True when a model is available, including a poor fit
    bool hasModel() const { return thermo.has_value(); }
};

class BatchRunner {
public:
    BatchRunner() = default;

    /// @brief Settings copied into every species run (outputs are ignored)
    explicit BatchRunner(const SpeciesIO& settings) : settings_(settings) {}

    SpeciesIO& getSettings() { return settings_; }
    const SpeciesIO& getSettings() const { return settings_; }

    /// @brief Set a tolerance by index for every species (see ToleranceIndex)
    void setTolerance(int index, double value) {
        if (index >= 0 && index < kNumTolerances) {
            tolerances_[index] = value;
        }
    }

    /// @brief Load and fit each record file
    std::vector<BatchOutcome> run(const std::vector<std::string>& filenames) const;

    /// @brief Fit each in-memory record
    std::vector<BatchOutcome> run(const std::vector<SpeciesRecord>& records) const;

    /// @brief Number of outcomes with a non-zero code
    static int countFailures(const std::vector<BatchOutcome>& outcomes);

    /// @brief Per-species status lines followed by the error list
    static void printSummary(const std::vector<BatchOutcome>& outcomes);

private:
    SpeciesIO settings_;
    Tolerances tolerances_;

    template <typename Source>
    std::vector<BatchOutcome> runAll(const std::vector<Source>& sources) const;
};

} // namespace Statmech
