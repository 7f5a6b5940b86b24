#include "statmech/context/SpeciesIO.hpp"

namespace Statmech {

std::string SpeciesIO::getOutputRecordPath(const std::string& label) const {
    std::string name = label.empty() ? std::string("species") : label;
    for (char& c : name) {
        if (c == '/' || c == '\\' || c == ' ') {
            c = '_';
        }
    }

    std::string dir = cOutputFilePath;
    auto end = dir.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) {
        return name + ".yml";
    }
    dir.erase(end + 1);
    if (dir.back() != '/' && dir.back() != '\\') {
        dir += '/';
    }
    return dir + name + ".yml";
}

void SpeciesIO::resetOutputs() {
    INFOSpecies = 0;
    cInfoDetail.clear();
    dTmidOut = 0.0;
    dFitResidual = 0.0;
    dContinuityError = 0.0;
    nFitIterations = 0;
    dH298 = 0.0;
    dS298 = 0.0;
    dCp298 = 0.0;
}

void SpeciesIO::reset() {
    iPrintResultsMode = 0;

    dTmin = Constants::kDefaultTmin;
    dTmax = Constants::kDefaultTmax;
    dTmid = Constants::kDefaultTmid;
    dPressure = Constants::kReferencePressure;

    nTmidCandidates = Constants::kDefaultTmidCandidates;
    nMaxFitIterations = Constants::kDefaultMaxFitIterations;
    nSamplePoints = Constants::kDefaultSamplePoints;
    nTorsionBasis = Constants::kDefaultTorsionBasis;

    cRecordFileName.clear();
    cOutputFilePath.clear();

    lTmidSearch = false;
    lWriteRecord = false;

    resetOutputs();
}

} // namespace Statmech
