/// @file ModeEvaluators.hpp
/// @brief Prepared, temperature-independent forms of each mode
/// @details Each evaluator precomputes everything that does not depend on T
/// so that evaluate(T) is a cheap pure function. The evaluators are combined
/// in a variant and dispatched with std::visit.

#pragma once

#include "statmech/solver/PartitionTerms.hpp"
#include "statmech/solver/TorsionSolver.hpp"
#include <variant>
#include <vector>

namespace Statmech {

/// @brief Ideal-gas translation at the reference pressure
/// @details Q = (2 pi m k T / h²)^{3/2} k T / P
struct TranslationEvaluator {
    double dLnPrefactor = 0.0;      ///< ln[(2 pi m k / h²)^{3/2} k / P]

    TranslationEvaluator(double massSI, double pressure);
    PartitionTerms evaluate(double T) const;
};

/// @brief Classical rigid rotor
/// @details Nonlinear: Q = sqrt(pi IA IB IC (8 pi² k T / h²)³) / sigma;
/// linear: Q = 8 pi² I k T / (sigma h²)
struct RigidRotorEvaluator {
    double dLnPrefactor = 0.0;
    double dExponent = 1.5;         ///< Power of T: 1.5 nonlinear, 1 linear

    explicit RigidRotorEvaluator(const NonlinearRotor& rotor);
    explicit RigidRotorEvaluator(const LinearRotor& rotor);
    PartitionTerms evaluate(double T) const;
};

/// @brief Independent quantum harmonic oscillators, Q = prod 1/(1 - e^{-x})
struct OscillatorEvaluator {
    std::vector<double> dTheta;     ///< Vibrational temperatures hc nu / k [K]

    /// @param wavenumbersSI Frequencies [m^-1], already scaled
    explicit OscillatorEvaluator(const std::vector<double>& wavenumbersSI);
    PartitionTerms evaluate(double T) const;
};

/// @brief Semiclassical hindered rotor
/// @details Q = [x/(1 - e^{-x})] sqrt(2 pi I k T / h²) (2 pi / sigma) e^{-z} I0(z),
/// x = theta/T from the torsional frequency, z = V0 / 2RT from the barrier.
struct SemiclassicalRotorEvaluator {
    double dTheta = 0.0;            ///< hc nu / k of the torsion [K]
    double dBarrier = 0.0;          ///< V0 [J/mol]
    double dLnPrefactor = 0.0;      ///< ln[sqrt(2 pi I k / h²) 2 pi / sigma]

    explicit SemiclassicalRotorEvaluator(const HinderedRotor& rotor);
    PartitionTerms evaluate(double T) const;
};

/// @brief Quantum hindered rotor over the cached torsional levels
struct QuantumRotorEvaluator {
    TorsionSolver solver;

    explicit QuantumRotorEvaluator(int basisHalfWidth) : solver(basisHalfWidth) {}
    PartitionTerms evaluate(double T) const { return solver.evaluate(T); }
};

using ModeEvaluator = std::variant<TranslationEvaluator,
                                   RigidRotorEvaluator,
                                   OscillatorEvaluator,
                                   SemiclassicalRotorEvaluator,
                                   QuantumRotorEvaluator>;

/// @brief Evaluate any prepared mode
inline PartitionTerms evaluateMode(const ModeEvaluator& mode, double T) {
    return std::visit([T](const auto& m) { return m.evaluate(T); }, mode);
}

/// @brief Bessel terms of the semiclassical rotor
/// @param z Reduced barrier V0 / 2RT
/// @param lnValue Output: ln[e^{-z} I0(z)]
/// @param ratio Output: I1(z) / I0(z)
/// @param ratioDerivative Output: d(I1/I0)/dz
/// @details Uses the asymptotic expansion for large z where I0 overflows
void scaledBesselTerms(double z, double& lnValue, double& ratio, double& ratioDerivative);

} // namespace Statmech
