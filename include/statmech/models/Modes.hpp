/// @file Modes.hpp
/// @brief Degree-of-freedom modes of a conformer
/// @details Modes are plain parameter holders combined in a tagged variant.
/// Evaluation lives in the solver layer (ModeEvaluators.hpp); this header
/// only carries the physical parameters, their validation and the
/// quantities derived from them that the species record reports.

#pragma once

#include "statmech/util/Constants.hpp"
#include "statmech/util/Quantity.hpp"
#include <string>
#include <variant>
#include <vector>

namespace Statmech {

/// @brief Ideal-gas translation of the whole molecule
struct IdealGasTranslation {
    Quantity mass{0.0, "amu"};
};

/// @brief Rigid nonlinear external rotor
struct NonlinearRotor {
    Quantity inertia{std::vector<double>{}, "amu*angstrom^2"};  ///< Three principal moments
    int symmetry = 1;                                           ///< External symmetry number
};

/// @brief Rigid linear external rotor
struct LinearRotor {
    Quantity inertia{0.0, "amu*angstrom^2"};
    int symmetry = 1;
};

/// @brief Set of independent harmonic oscillators
struct HarmonicOscillator {
    Quantity frequencies{std::vector<double>{}, "cm^-1"};       ///< Unscaled frequencies
};

/// @brief Treatment of a hindered internal rotor
enum class TorsionTreatment {
    Quantum,        ///< Eigenvalues of the 1-D torsional Hamiltonian
    Semiclassical   ///< Free-rotor / harmonic-oscillator blend
};

/// @brief One-dimensional hindered internal rotor
/// @details The potential is either a truncated Fourier series
/// V(phi) = sum_k [a_k cos(k phi) + b_k sin(k phi)] - sum_k a_k
/// (row 0: a_k, row 1: b_k), or, when no Fourier data is present, the cosine
/// form V(phi) = V0/2 (1 - cos(symmetry phi)).
struct HinderedRotor {
    Quantity inertia{0.0, "amu*angstrom^2"};                    ///< Reduced moment of inertia
    int symmetry = 1;
    Quantity fourier{std::vector<double>{}, "kJ/mol"};          ///< 2 x K coefficients, or empty
    Quantity barrier{0.0, "kJ/mol"};                            ///< V0 of the cosine form
    TorsionTreatment treatment = TorsionTreatment::Semiclassical;

    bool hasFourier() const { return fourier.is2D() && fourier.size() > 0; }
};

using Mode = std::variant<IdealGasTranslation,
                          NonlinearRotor,
                          LinearRotor,
                          HarmonicOscillator,
                          HinderedRotor>;

/// @brief Get the variant tag of a mode
Constants::ModeType getModeType(const Mode& mode);

/// @brief Get the record class name of a mode (e.g. "HinderedRotor")
const char* getModeName(const Mode& mode);

/// @brief Check physical parameters and their dimensions
/// @param mode Mode to check
/// @param detail Output: description of the first offending parameter
/// @return Error code (0 = success, kInvalidModeParameter, kUnitMismatch)
int validateMode(const Mode& mode, std::string& detail);

// ----------------------------------------------------------------------------
// Derived quantities
// ----------------------------------------------------------------------------

/// @brief Rotational constant B = h / (8 pi^2 c I) for a moment of inertia
/// @param inertiaSI Moment of inertia [kg·m²]
/// @return B [cm^-1]
double rotationalConstantFromInertia(double inertiaSI);

/// @brief Rotational constants of a nonlinear rotor [cm^-1]
Quantity getRotationalConstants(const NonlinearRotor& rotor);

/// @brief Rotational constant of a linear rotor [cm^-1]
Quantity getRotationalConstant(const LinearRotor& rotor);

/// @brief Rotational constant of a hindered rotor's internal top [cm^-1]
Quantity getRotationalConstant(const HinderedRotor& rotor);

/// @brief Torsional potential
/// @param rotor Hindered rotor
/// @param phi Torsion angle [rad]
/// @return V(phi) [J/mol], zero at phi = 0
double getTorsionalPotential(const HinderedRotor& rotor, double phi);

/// @brief Curvature of the torsional potential at the scan origin
/// @return d²V/dphi² at phi = 0 [J/mol/rad²]
double getTorsionalCurvature(const HinderedRotor& rotor);

/// @brief Barrier height max(V) - min(V) of the torsional potential [J/mol]
double getTorsionalBarrier(const HinderedRotor& rotor);

/// @brief Harmonic frequency of the torsion at the scan origin [cm^-1]
/// @details nu = sqrt(V''(0) / (N_A I)) / (2 pi c); zero if V''(0) <= 0
double getTorsionalFrequency(const HinderedRotor& rotor);

} // namespace Statmech
