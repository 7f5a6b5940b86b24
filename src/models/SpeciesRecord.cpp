#include "statmech/models/SpeciesRecord.hpp"
#include "statmech/util/ErrorCodes.hpp"

namespace Statmech {

std::pair<double, int> SpeciesRecord::getMolecularWeight() const {
    if (molecularWeight) {
        return {molecularWeight->valueIn("amu"), 0};
    }
    if (conformer && conformer->hasGeometry()) {
        return {conformer->getTotalMass() / Constants::kAtomicMassUnit, 0};
    }
    if (conformer) {
        if (const auto* translation = conformer->findMode<IdealGasTranslation>()) {
            return {translation->mass.valueIn("amu"), 0};
        }
    }
    return {0.0, ErrorCode::kNoConformer};
}

int SpeciesRecord::validate(std::string& detail) const {
    if (!conformer) {
        detail = label + ": no conformer";
        return ErrorCode::kNoConformer;
    }
    if (!(frequencyScaleFactor > 0.0)) {
        detail = label + ": frequency_scale_factor must be positive";
        return ErrorCode::kInvalidModeParameter;
    }
    if (molecularWeight && (!molecularWeight->hasDimension(Dimensions::kMass) ||
                            molecularWeight->isArray())) {
        detail = label + ": molecular_weight has units [" + molecularWeight->units() + "]";
        return ErrorCode::kUnitMismatch;
    }
    int info = conformer->validate(detail);
    if (info != 0) {
        return info;
    }
    if (energyTransfer) {
        info = energyTransfer->validate(detail);
        if (info != 0) {
            return info;
        }
    }
    return ErrorCode::kSuccess;
}

} // namespace Statmech
