/// @file Conformer.hpp
/// @brief One spatial/vibrational configuration of a species

#pragma once

#include "statmech/models/Modes.hpp"
#include "statmech/util/Quantity.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace Statmech {

/// @brief Geometry, mass distribution and degrees of freedom of one conformer
/// @details The geometry, mass and atomic-number arrays are optional as a
/// group (a conformer may be described by its modes alone), but when present
/// they describe the same atoms in the same order.
struct Conformer {
    Quantity E0{0.0, "kJ/mol"};                                     ///< Zero-point-corrected ground-state energy
    Quantity coordinates{std::vector<double>{}, "angstroms", 3};    ///< N x 3 Cartesian positions
    Quantity mass{std::vector<double>{}, "amu"};                    ///< N atomic masses
    std::vector<int> atomicNumbers;                                 ///< N atomic numbers
    std::vector<Mode> modes;                                        ///< Ordered degrees of freedom
    int opticalIsomers = 1;
    int spinMultiplicity = 1;

    /// @brief Number of atoms (0 if no geometry is attached)
    int getAtomCount() const;

    /// @brief True if coordinates, masses and atomic numbers are present
    bool hasGeometry() const { return !coordinates.empty(); }

    /// @brief Check array lengths, units, multiplicities and every mode
    /// @param detail Output: description of the first problem found
    /// @return Error code (0 = success)
    int validate(std::string& detail) const;

    /// @brief Total mass from the atom masses [kg]
    double getTotalMass() const;

    /// @brief Mass-weighted centre of the geometry [m]
    Eigen::Vector3d getCenterOfMass() const;

    /// @brief Principal moments of inertia from the geometry, ascending
    /// @return Moments [amu*angstrom^2]
    Quantity getPrincipalMomentsOfInertia() const;

    /// @brief Molecular formula in Hill order (e.g. "H4N2")
    std::string getMolecularFormula() const;

    /// @brief Number of modes of a given variant
    int countModes(Constants::ModeType type) const;

    /// @brief First mode of a given variant, or nullptr
    template <typename T>
    const T* findMode() const {
        for (const auto& mode : modes) {
            if (const T* m = std::get_if<T>(&mode)) {
                return m;
            }
        }
        return nullptr;
    }
};

} // namespace Statmech
