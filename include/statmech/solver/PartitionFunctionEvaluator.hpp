/// @file PartitionFunctionEvaluator.hpp
/// @brief Combined molecular partition function of a conformer
/// @details prepare() validates the conformer and turns each mode into a
/// ModeEvaluator; evaluate(T) then sums the per-mode ln Q terms (the modes
/// are independent, so their partition functions multiply) and adds the
/// electronic and optical-isomer degeneracy.

#pragma once

#include "statmech/models/Conformer.hpp"
#include "statmech/solver/ModeEvaluators.hpp"
#include <string>
#include <vector>

namespace Statmech {

/// @brief Settings that change how modes are evaluated
struct PartitionSettings {
    double dFrequencyScaleFactor = 1.0;                     ///< Applied to oscillator frequencies
    bool lUseHinderedRotors = true;                         ///< False: torsions as oscillators
    int nTorsionBasis = Constants::kDefaultTorsionBasis;    ///< Quantum rotor basis half-width
    double dPressure = Constants::kReferencePressure;       ///< Standard-state pressure [Pa]
};

class PartitionFunctionEvaluator {
public:
    /// @brief Validate the conformer and precompute every mode
    /// @param conformer Conformer to evaluate
    /// @param settings Evaluation settings
    /// @param detail Output: description of the first problem found
    /// @return Error code (0 = success, kInvalidModeParameter, kUnsupportedMode,
    ///         kInvalidConformer, kUnitMismatch)
    int prepare(const Conformer& conformer, const PartitionSettings& settings,
                std::string& detail);

    /// @brief Combined partition function terms at T
    /// @param T Temperature [K]
    /// @param terms Output: summed ln Q and derivatives
    /// @return Error code (0 = success, kInvalidTemperature, kNoConformer if unprepared)
    int evaluate(double T, PartitionTerms& terms) const;

    /// @brief Per-mode terms at T, in conformer mode order (degeneracy excluded)
    int evaluateModes(double T, std::vector<PartitionTerms>& terms) const;

    bool isPrepared() const { return lPrepared_; }

    /// @brief Names of the evaluated modes, e.g. "HinderedRotor (semiclassical)"
    const std::vector<std::string>& getModeLabels() const { return cModeLabels_; }

    /// @brief Number of vibrational degrees of freedom (oscillator frequencies)
    int getNumVibrations() const { return nVibrations_; }

    /// @brief Number of torsions evaluated as hindered rotors
    int getNumTorsions() const { return nTorsions_; }

    /// @brief Low-temperature Cp limit from translation and external rotation [J/(mol·K)]
    double getCp0() const { return dCp0_; }

    /// @brief High-temperature Cp limit [J/(mol·K)]
    double getCpInf() const;

    const char* getEvaluatorName() const { return "PartitionFunctionEvaluator"; }

private:
    std::vector<ModeEvaluator> modes_;
    std::vector<std::string> cModeLabels_;
    double dLnDegeneracy_ = 0.0;
    double dCp0_ = 0.0;
    int nVibrations_ = 0;
    int nTorsions_ = 0;
    bool lPrepared_ = false;

    void clear();
};

} // namespace Statmech
