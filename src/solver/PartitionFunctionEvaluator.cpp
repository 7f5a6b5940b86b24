#include "statmech/solver/PartitionFunctionEvaluator.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <cmath>

namespace Statmech {

using Constants::kIdealGasConstant;

void PartitionFunctionEvaluator::clear() {
    modes_.clear();
    cModeLabels_.clear();
    dLnDegeneracy_ = 0.0;
    dCp0_ = 0.0;
    nVibrations_ = 0;
    nTorsions_ = 0;
    lPrepared_ = false;
}

int PartitionFunctionEvaluator::prepare(const Conformer& conformer,
                                        const PartitionSettings& settings,
                                        std::string& detail) {
    clear();

    if (!(settings.dFrequencyScaleFactor > 0.0) || !(settings.dPressure > 0.0)) {
        detail = "frequency scale factor and pressure must be positive";
        return ErrorCode::kInvalidModeParameter;
    }
    int info = conformer.validate(detail);
    if (info != 0) {
        return info;
    }

    int nTranslation = conformer.countModes(Constants::ModeType::Translation);
    int nExternalRotor = conformer.countModes(Constants::ModeType::NonlinearRotor) +
                         conformer.countModes(Constants::ModeType::LinearRotor);
    if (nTranslation > 1 || nExternalRotor > 1) {
        detail = "conformer has " + std::to_string(nTranslation) + " translations and " +
                 std::to_string(nExternalRotor) + " external rotors (at most one of each)";
        return ErrorCode::kUnsupportedMode;
    }

    for (std::size_t i = 0; i < conformer.modes.size(); ++i) {
        const Mode& mode = conformer.modes[i];

        if (const auto* m = std::get_if<IdealGasTranslation>(&mode)) {
            modes_.emplace_back(TranslationEvaluator(m->mass.valueSI(), settings.dPressure));
            cModeLabels_.push_back(getModeName(mode));
            dCp0_ += 2.5 * kIdealGasConstant;
        } else if (const auto* m = std::get_if<NonlinearRotor>(&mode)) {
            modes_.emplace_back(RigidRotorEvaluator(*m));
            cModeLabels_.push_back(getModeName(mode));
            dCp0_ += 1.5 * kIdealGasConstant;
        } else if (const auto* m = std::get_if<LinearRotor>(&mode)) {
            modes_.emplace_back(RigidRotorEvaluator(*m));
            cModeLabels_.push_back(getModeName(mode));
            dCp0_ += kIdealGasConstant;
        } else if (const auto* m = std::get_if<HarmonicOscillator>(&mode)) {
            std::vector<double> nu = m->frequencies.valuesSI();
            for (auto& v : nu) {
                v *= settings.dFrequencyScaleFactor;
            }
            nVibrations_ += static_cast<int>(nu.size());
            modes_.emplace_back(OscillatorEvaluator(nu));
            cModeLabels_.push_back(getModeName(mode));
        } else if (const auto* m = std::get_if<HinderedRotor>(&mode)) {
            if (!settings.lUseHinderedRotors) {
                double nu = getTorsionalFrequency(*m) * 100.0 * settings.dFrequencyScaleFactor;
                ++nVibrations_;
                modes_.emplace_back(OscillatorEvaluator({nu}));
                cModeLabels_.push_back("HinderedRotor (harmonic)");
            } else if (m->treatment == TorsionTreatment::Quantum) {
                QuantumRotorEvaluator quantum(settings.nTorsionBasis);
                info = quantum.solver.solve(*m);
                if (info != 0) {
                    detail = "mode " + std::to_string(i) +
                             ": torsional eigenvalue solve failed for " +
                             std::to_string(2 * settings.nTorsionBasis + 1) + " basis functions";
                    clear();
                    return info;
                }
                ++nTorsions_;
                modes_.emplace_back(std::move(quantum));
                cModeLabels_.push_back("HinderedRotor (quantum)");
            } else if (m->treatment == TorsionTreatment::Semiclassical) {
                ++nTorsions_;
                modes_.emplace_back(SemiclassicalRotorEvaluator(*m));
                cModeLabels_.push_back("HinderedRotor (semiclassical)");
            } else {
                detail = "mode " + std::to_string(i) + ": unknown torsion treatment";
                clear();
                return ErrorCode::kUnsupportedMode;
            }
        } else {
            detail = "mode " + std::to_string(i) + ": unsupported mode";
            clear();
            return ErrorCode::kUnsupportedMode;
        }
    }

    dLnDegeneracy_ = std::log(static_cast<double>(conformer.spinMultiplicity) *
                              static_cast<double>(conformer.opticalIsomers));
    lPrepared_ = true;
    return ErrorCode::kSuccess;
}

int PartitionFunctionEvaluator::evaluate(double T, PartitionTerms& terms) const {
    terms = PartitionTerms{};
    if (!lPrepared_) {
        return ErrorCode::kNoConformer;
    }
    if (!(T > 0.0) || !std::isfinite(T)) {
        return ErrorCode::kInvalidTemperature;
    }
    for (const auto& mode : modes_) {
        terms += evaluateMode(mode, T);
    }
    terms.lnQ += dLnDegeneracy_;
    return ErrorCode::kSuccess;
}

int PartitionFunctionEvaluator::evaluateModes(double T, std::vector<PartitionTerms>& terms) const {
    terms.clear();
    if (!lPrepared_) {
        return ErrorCode::kNoConformer;
    }
    if (!(T > 0.0) || !std::isfinite(T)) {
        return ErrorCode::kInvalidTemperature;
    }
    terms.reserve(modes_.size());
    for (const auto& mode : modes_) {
        terms.push_back(evaluateMode(mode, T));
    }
    return ErrorCode::kSuccess;
}

double PartitionFunctionEvaluator::getCpInf() const {
    return dCp0_ + (nVibrations_ + 0.5 * nTorsions_) * kIdealGasConstant;
}

} // namespace Statmech
