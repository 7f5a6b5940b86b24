#include "statmech/solver/TorsionSolver.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <Eigen/Eigenvalues>
#include <cmath>
#include <complex>

namespace Statmech {

using Constants::kIdealGasConstant;

TorsionSolver::TorsionSolver(int basisHalfWidth)
    : nHalfWidth_(basisHalfWidth)
{
}

Eigen::MatrixXcd TorsionSolver::buildHamiltonian(const HinderedRotor& rotor) const {
    const int n = 2 * nHalfWidth_ + 1;
    const double hbar = Constants::kPlanck / (2.0 * Constants::kPi);

    // Rotational constant B = hbar² / 2I, per mole
    double b = hbar * hbar / (2.0 * rotor.inertia.valueSI()) * Constants::kAvogadro;

    Eigen::MatrixXcd hamiltonian = Eigen::MatrixXcd::Zero(n, n);
    for (int i = 0; i < n; ++i) {
        double m = static_cast<double>(i - nHalfWidth_);
        hamiltonian(i, i) = b * m * m;
    }

    // <m|cos(k phi)|m'> = 1/2 and <m|sin(k phi)|m'> = -/+ i/2 for m - m' = +/- k
    auto addTerm = [&](int k, double a, double s) {
        const std::complex<double> upper(0.5 * a, -0.5 * s);   // m - m' = +k
        for (int i = k; i < n; ++i) {
            hamiltonian(i, i - k) += upper;
            hamiltonian(i - k, i) += std::conj(upper);
        }
    };

    if (rotor.hasFourier()) {
        double factor = findUnit(rotor.fourier.units())->factorToSI;
        double offset = 0.0;
        for (std::size_t k = 0; k < rotor.fourier.columns(); ++k) {
            double a = rotor.fourier.at(0, k) * factor;
            double s = rotor.fourier.at(1, k) * factor;
            offset += a;
            if (static_cast<int>(k) + 1 < n) {
                addTerm(static_cast<int>(k) + 1, a, s);
            }
        }
        hamiltonian.diagonal().array() -= offset;
    } else {
        double v0 = rotor.barrier.valueIn("J/mol");
        hamiltonian.diagonal().array() += 0.5 * v0;
        if (rotor.symmetry < n) {
            addTerm(rotor.symmetry, -0.5 * v0, 0.0);
        }
    }
    return hamiltonian;
}

int TorsionSolver::solve(const HinderedRotor& rotor) {
    levels_.resize(0);
    if (nHalfWidth_ < 1) {
        return ErrorCode::kInvalidModeParameter;
    }
    symmetry_ = rotor.symmetry;

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> eigen(buildHamiltonian(rotor),
                                                          Eigen::EigenvaluesOnly);
    if (eigen.info() != Eigen::Success) {
        return ErrorCode::kInvalidModeParameter;
    }

    levels_ = eigen.eigenvalues();
    levels_.array() -= levels_(0);
    return ErrorCode::kSuccess;
}

PartitionTerms TorsionSolver::evaluate(double T) const {
    const double rt = kIdealGasConstant * T;

    // Levels are shifted so the ground state has weight 1
    double sum = 0.0;
    double sumE = 0.0;
    double sumE2 = 0.0;
    for (Eigen::Index i = 0; i < levels_.size(); ++i) {
        double e = levels_(i);
        double w = std::exp(-e / rt);
        if (w == 0.0) break;
        sum += w;
        sumE += e * w;
        sumE2 += e * e * w;
    }
    double meanE = sumE / sum;
    double varE = sumE2 / sum - meanE * meanE;

    PartitionTerms terms;
    terms.lnQ = std::log(sum) - std::log(static_cast<double>(symmetry_));
    terms.dlnQdT = meanE / (rt * T);
    terms.d2lnQdT2 = varE / (rt * rt * T * T) - 2.0 * meanE / (rt * T * T);
    return terms;
}

} // namespace Statmech
