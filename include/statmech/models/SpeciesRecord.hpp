/// @file SpeciesRecord.hpp
/// @brief Aggregate description of one characterized species

#pragma once

#include "statmech/models/Conformer.hpp"
#include "statmech/models/EnergyTransferModel.hpp"
#include "statmech/models/NASA.hpp"
#include <optional>
#include <string>

namespace Statmech {

/// @brief Identity, primary conformer and fitted models of a species
struct SpeciesRecord {
    // Identity
    std::string label;
    std::string smiles;
    std::string inchi;
    std::string inchiKey;
    std::string adjacencyList;
    std::string datetime;
    std::string generatorVersion;
    bool isTS = false;
    bool useBondCorrections = false;
    std::optional<Quantity> molecularWeight;        ///< [amu]

    // Statistical-mechanics input
    std::optional<Conformer> conformer;
    double frequencyScaleFactor = 1.0;
    bool useHinderedRotors = true;

    // Attached models
    std::optional<NASA> thermo;
    std::optional<SingleExponentialDown> energyTransfer;

    /// @brief Molecular weight, falling back to the conformer's atom masses
    /// @return Pair of (weight in amu, error code)
    std::pair<double, int> getMolecularWeight() const;

    /// @brief Check the conformer, energy-transfer model and scale factor
    /// @param detail Output: description of the first problem found
    /// @return Error code (0 = success)
    int validate(std::string& detail) const;
};

} // namespace Statmech
