#include "statmech/solver/ModeEvaluators.hpp"
#include <cmath>

namespace Statmech {

using namespace Constants;

namespace {

constexpr double kBesselAsymptoticLimit = 500.0;

/// Adds the quantum/classical oscillator ratio x/(1 - e^{-x}) for x = theta/T
void addOscillatorCorrection(double theta, double T, PartitionTerms& terms) {
    double x = theta / T;
    double em = std::exp(-x);
    double den = -std::expm1(-x);
    terms.lnQ += std::log(x) - std::log(den);
    terms.dlnQdT += -1.0 / T + (theta / (T * T)) * em / den;
    terms.d2lnQdT2 += 1.0 / (T * T) - 2.0 * theta / (T * T * T) * em / den +
                      theta * theta / (T * T * T * T) * em / (den * den);
}

} // namespace

void scaledBesselTerms(double z, double& lnValue, double& ratio, double& ratioDerivative) {
    if (z < 1.0e-8) {
        lnValue = -z + 0.25 * z * z;
        ratio = 0.5 * z;
        ratioDerivative = 0.5;
        return;
    }
    if (z < kBesselAsymptoticLimit) {
        double i0 = std::cyl_bessel_i(0.0, z);
        double i1 = std::cyl_bessel_i(1.0, z);
        lnValue = -z + std::log(i0);
        ratio = i1 / i0;
    } else {
        // e^{-z} I_nu(z) ~ (2 pi z)^{-1/2} [1 - (4nu² - 1)/8z + (4nu² - 1)(4nu² - 9)/2!(8z)²]
        double s0 = 1.0 + 1.0 / (8.0 * z) + 9.0 / (128.0 * z * z);
        double s1 = 1.0 - 3.0 / (8.0 * z) - 15.0 / (128.0 * z * z);
        lnValue = -0.5 * std::log(2.0 * kPi * z) + std::log(s0);
        ratio = s1 / s0;
    }
    ratioDerivative = 1.0 - ratio / z - ratio * ratio;
}

// ----------------------------------------------------------------------------
// Translation
// ----------------------------------------------------------------------------

TranslationEvaluator::TranslationEvaluator(double massSI, double pressure) {
    dLnPrefactor = 1.5 * std::log(2.0 * kPi * massSI * kBoltzmann / (kPlanck * kPlanck)) +
                   std::log(kBoltzmann / pressure);
}

PartitionTerms TranslationEvaluator::evaluate(double T) const {
    PartitionTerms terms;
    terms.lnQ = dLnPrefactor + 2.5 * std::log(T);
    terms.dlnQdT = 2.5 / T;
    terms.d2lnQdT2 = -2.5 / (T * T);
    return terms;
}

// ----------------------------------------------------------------------------
// Rigid rotors
// ----------------------------------------------------------------------------

RigidRotorEvaluator::RigidRotorEvaluator(const NonlinearRotor& rotor)
    : dExponent(1.5)
{
    std::vector<double> inertia = rotor.inertia.valuesSI();
    double rotorFactor = 8.0 * kPi * kPi * kBoltzmann / (kPlanck * kPlanck);
    dLnPrefactor = 0.5 * std::log(kPi * inertia[0] * inertia[1] * inertia[2]) +
                   1.5 * std::log(rotorFactor) - std::log(static_cast<double>(rotor.symmetry));
}

RigidRotorEvaluator::RigidRotorEvaluator(const LinearRotor& rotor)
    : dExponent(1.0)
{
    double rotorFactor = 8.0 * kPi * kPi * kBoltzmann / (kPlanck * kPlanck);
    dLnPrefactor = std::log(rotorFactor * rotor.inertia.valueSI()) -
                   std::log(static_cast<double>(rotor.symmetry));
}

PartitionTerms RigidRotorEvaluator::evaluate(double T) const {
    PartitionTerms terms;
    terms.lnQ = dLnPrefactor + dExponent * std::log(T);
    terms.dlnQdT = dExponent / T;
    terms.d2lnQdT2 = -dExponent / (T * T);
    return terms;
}

// ----------------------------------------------------------------------------
// Harmonic oscillators
// ----------------------------------------------------------------------------

OscillatorEvaluator::OscillatorEvaluator(const std::vector<double>& wavenumbersSI) {
    dTheta.reserve(wavenumbersSI.size());
    for (double nu : wavenumbersSI) {
        dTheta.push_back(kPlanck * kSpeedOfLight * nu / kBoltzmann);
    }
}

PartitionTerms OscillatorEvaluator::evaluate(double T) const {
    PartitionTerms terms;
    for (double theta : dTheta) {
        double x = theta / T;
        double em = std::exp(-x);
        double den = -std::expm1(-x);
        terms.lnQ -= std::log(den);
        terms.dlnQdT += (theta / (T * T)) * em / den;
        terms.d2lnQdT2 += -2.0 * theta / (T * T * T) * em / den +
                          theta * theta / (T * T * T * T) * em / (den * den);
    }
    return terms;
}

// ----------------------------------------------------------------------------
// Semiclassical hindered rotor
// ----------------------------------------------------------------------------

SemiclassicalRotorEvaluator::SemiclassicalRotorEvaluator(const HinderedRotor& rotor) {
    double nu = getTorsionalFrequency(rotor) * 100.0;   // m^-1
    dTheta = kPlanck * kSpeedOfLight * nu / kBoltzmann;
    dBarrier = getTorsionalBarrier(rotor);
    double inertia = rotor.inertia.valueSI();
    dLnPrefactor = 0.5 * std::log(2.0 * kPi * inertia * kBoltzmann / (kPlanck * kPlanck)) +
                   std::log(2.0 * kPi / static_cast<double>(rotor.symmetry));
}

PartitionTerms SemiclassicalRotorEvaluator::evaluate(double T) const {
    PartitionTerms terms;
    addOscillatorCorrection(dTheta, T, terms);

    // Free-rotor part
    terms.lnQ += dLnPrefactor + 0.5 * std::log(T);
    terms.dlnQdT += 0.5 / T;
    terms.d2lnQdT2 += -0.5 / (T * T);

    // Barrier damping e^{-z} I0(z), z = V0 / 2RT
    double z = dBarrier / (2.0 * kIdealGasConstant * T);
    double lnBessel = 0.0;
    double r = 0.0;
    double dr = 0.0;
    scaledBesselTerms(z, lnBessel, r, dr);
    terms.lnQ += lnBessel;
    terms.dlnQdT += (z / T) * (1.0 - r);
    terms.d2lnQdT2 += -2.0 * z * (1.0 - r) / (T * T) + z * z * dr / (T * T);
    return terms;
}

} // namespace Statmech
