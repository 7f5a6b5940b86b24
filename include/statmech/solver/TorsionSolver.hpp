/// @file TorsionSolver.hpp
/// @brief Energy levels of a one-dimensional hindered rotor
/// @details Diagonalizes H = -B d²/dphi² + V(phi) in the free-rotor basis
/// e^{i m phi}, m = -M..M. The kinetic part is diagonal (B m²); a Fourier term
/// of order k couples m and m +/- k. The matrix is complex Hermitian whenever
/// the potential has sine terms.

#pragma once

#include "statmech/models/Modes.hpp"
#include "statmech/solver/PartitionTerms.hpp"
#include <Eigen/Dense>

namespace Statmech {

class TorsionSolver {
public:
    /// @brief Constructor
    /// @param basisHalfWidth M, giving 2M+1 basis functions
    explicit TorsionSolver(int basisHalfWidth = Constants::kDefaultTorsionBasis);

    /// @brief Build and diagonalize the torsional Hamiltonian
    /// @param rotor Validated hindered rotor
    /// @return Error code (0 = success, kInvalidModeParameter if the
    ///         eigen-solver fails or the basis is too small)
    int solve(const HinderedRotor& rotor);

    /// @brief Levels relative to the ground state [J/mol], ascending
    const Eigen::VectorXd& getEnergyLevels() const { return levels_; }

    /// @brief Partition function sum over the levels, divided by the symmetry number
    /// @param T Temperature [K]
    PartitionTerms evaluate(double T) const;

    bool isSolved() const { return levels_.size() > 0; }

    const char* getSolverName() const { return "TorsionSolver"; }

private:
    int nHalfWidth_;
    int symmetry_ = 1;
    Eigen::VectorXd levels_;

    /// @brief Assemble H [J/mol] in the free-rotor basis
    Eigen::MatrixXcd buildHamiltonian(const HinderedRotor& rotor) const;
};

} // namespace Statmech
