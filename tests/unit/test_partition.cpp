#include <gtest/gtest.h>
#include <statmech/solver/ThermoEvaluator.hpp>
#include <statmech/util/ErrorCodes.hpp>
#include "SpeciesFixtures.hpp"
#include <cmath>

using namespace Statmech;
using namespace StatmechTest;

namespace {

constexpr double R = Constants::kIdealGasConstant;

double heatCapacity(const PartitionTerms& terms, double T) {
    return R * (T * T * terms.d2lnQdT2 + 2.0 * T * terms.dlnQdT);
}

/// Einstein function: Cp/R of one oscillator
double einstein(double theta, double T) {
    double x = theta / T;
    double ex = std::exp(-x);
    return x * x * ex / ((1.0 - ex) * (1.0 - ex));
}

} // namespace

TEST(TranslationTest, PartitionFunctionAt300K) {
    TranslationEvaluator translation(32.0 * Constants::kAtomicMassUnit,
                                     Constants::kReferencePressure);
    PartitionTerms terms = translation.evaluate(300.0);

    EXPECT_NEAR(terms.lnQ, 15.806355320518815, 1e-9);
    EXPECT_NEAR(terms.dlnQdT, 2.5 / 300.0, 1e-15);
    EXPECT_NEAR(heatCapacity(terms, 300.0), 2.5 * R, 1e-10);
}

TEST(TranslationTest, ArgonEntropy) {
    ThermoEvaluator evaluator;
    PartitionSettings settings;
    std::string detail;
    ASSERT_EQ(evaluator.prepare(makeAtomConformer(39.948), settings, detail), 0) << detail;

    ThermoPoint point;
    ASSERT_EQ(evaluator.evaluate(298.15, point), 0);
    EXPECT_NEAR(point.dEntropy, 154.8459, 1e-3);
    EXPECT_NEAR(point.dHeatCapacity, 2.5 * R, 1e-9);
    EXPECT_NEAR(point.dEnthalpy, 2.5 * R * 298.15, 1e-6);
    EXPECT_NEAR(point.dGibbsEnergy, point.dEnthalpy - 298.15 * point.dEntropy, 1e-9);
}

TEST(RigidRotorTest, HeatCapacityLimits) {
    NonlinearRotor nonlinear;
    nonlinear.inertia = Quantity(std::vector<double>{1.0, 2.0, 3.0}, "amu*angstrom^2");
    LinearRotor linear;
    linear.inertia = Quantity(10.0, "amu*angstrom^2");
    linear.symmetry = 2;

    RigidRotorEvaluator nonlinearEval(nonlinear);
    RigidRotorEvaluator linearEval(linear);
    for (double T : {50.0, 300.0, 2000.0}) {
        EXPECT_NEAR(heatCapacity(nonlinearEval.evaluate(T), T), 1.5 * R, 1e-10);
        EXPECT_NEAR(heatCapacity(linearEval.evaluate(T), T), R, 1e-10);
    }

    // Symmetry number divides Q
    LinearRotor asymmetric = linear;
    asymmetric.symmetry = 1;
    double dLnQ = RigidRotorEvaluator(asymmetric).evaluate(300.0).lnQ -
                  linearEval.evaluate(300.0).lnQ;
    EXPECT_NEAR(dLnQ, std::log(2.0), 1e-12);
}

TEST(OscillatorTest, HeatCapacityLimits) {
    // 1000 cm^-1
    OscillatorEvaluator oscillator({1.0e5});
    double theta = oscillator.dTheta[0];
    EXPECT_NEAR(theta, 1438.777, 1e-2);

    EXPECT_NEAR(heatCapacity(oscillator.evaluate(10.0), 10.0), 0.0, 1e-12);
    EXPECT_NEAR(heatCapacity(oscillator.evaluate(3000.0), 3000.0) / R, einstein(theta, 3000.0),
                1e-9);
    EXPECT_NEAR(heatCapacity(oscillator.evaluate(1.0e5), 1.0e5), R, 1e-3 * R);

    for (double T : {100.0, 500.0, 1000.0}) {
        EXPECT_NEAR(heatCapacity(oscillator.evaluate(T), T) / R, einstein(theta, T), 1e-9);
    }
}

TEST(SemiclassicalRotorTest, Limits) {
    HinderedRotor rotor;
    rotor.inertia = Quantity(1.0, "amu*angstrom^2");
    rotor.symmetry = 3;
    rotor.barrier = Quantity(1.0, "kJ/mol");
    SemiclassicalRotorEvaluator lowBarrier(rotor);

    // Nearly free rotor at high temperature
    EXPECT_NEAR(heatCapacity(lowBarrier.evaluate(5000.0), 5000.0), 0.5 * R, 0.01 * R);

    SemiclassicalRotorEvaluator n2h4(makeN2H4Torsion());
    EXPECT_LT(heatCapacity(n2h4.evaluate(20.0), 20.0), 0.05 * R);
    for (double T = 50.0; T <= 3000.0; T += 50.0) {
        double cp = heatCapacity(n2h4.evaluate(T), T);
        EXPECT_GT(cp, 0.0) << "T = " << T;
        EXPECT_LT(cp, 1.5 * R) << "T = " << T;
    }
}

TEST(SemiclassicalRotorTest, BesselTerms) {
    // ln(e^-z I0(z)) and I1/I0 on both sides of the asymptotic switch
    double lnValue = 0.0, ratio = 0.0, ratioDerivative = 0.0;
    scaledBesselTerms(1.0, lnValue, ratio, ratioDerivative);
    EXPECT_NEAR(lnValue, std::log(1.2660658777520082) - 1.0, 1e-12);
    EXPECT_NEAR(ratio, 0.5651591039924851 / 1.2660658777520082, 1e-12);

    // Each side of the switch against the converged asymptotic expansion
    scaledBesselTerms(499.999, lnValue, ratio, ratioDerivative);
    EXPECT_NEAR(lnValue, -4.0259913313913, 1e-8);
    EXPECT_NEAR(ratio, 0.9989994969948519, 1e-8);

    scaledBesselTerms(500.001, lnValue, ratio, ratioDerivative);
    EXPECT_NEAR(lnValue, -4.025993332393306, 1e-8);
    EXPECT_NEAR(ratio, 0.998999500998864, 1e-8);
}

TEST(PartitionFunctionTest, N2H4Limits) {
    PartitionFunctionEvaluator partition;
    PartitionSettings settings;
    settings.dFrequencyScaleFactor = 0.97;
    std::string detail;
    ASSERT_EQ(partition.prepare(makeN2H4Conformer(), settings, detail), 0) << detail;

    EXPECT_EQ(partition.getNumVibrations(), 11);
    EXPECT_EQ(partition.getNumTorsions(), 1);
    EXPECT_NEAR(partition.getCp0(), 4.0 * R, 1e-12);
    EXPECT_NEAR(partition.getCpInf(), 15.5 * R, 1e-12);
    EXPECT_NEAR(partition.getCp0(), 33.257888, 1e-9);
    EXPECT_NEAR(partition.getCpInf(), 128.874316, 1e-9);

    ASSERT_EQ(partition.getModeLabels().size(), 4u);
    EXPECT_EQ(partition.getModeLabels()[3], "HinderedRotor (semiclassical)");

    std::vector<PartitionTerms> modes;
    PartitionTerms total;
    ASSERT_EQ(partition.evaluateModes(500.0, modes), 0);
    ASSERT_EQ(partition.evaluate(500.0, total), 0);
    double sum = 0.0;
    for (const auto& m : modes) {
        sum += m.lnQ;
    }
    EXPECT_NEAR(sum, total.lnQ, 1e-10);    // degeneracy is 1
}

TEST(PartitionFunctionTest, TorsionsAsOscillators) {
    PartitionFunctionEvaluator partition;
    PartitionSettings settings;
    settings.lUseHinderedRotors = false;
    std::string detail;
    ASSERT_EQ(partition.prepare(makeN2H4Conformer(), settings, detail), 0) << detail;

    EXPECT_EQ(partition.getNumVibrations(), 12);
    EXPECT_EQ(partition.getNumTorsions(), 0);
    EXPECT_NEAR(partition.getCpInf(), 16.0 * R, 1e-12);
    EXPECT_EQ(partition.getModeLabels()[3], "HinderedRotor (harmonic)");
}

TEST(PartitionFunctionTest, DegeneracyAddsLogTerm) {
    Conformer singlet = makeAtomConformer(16.0);
    Conformer triplet = singlet;
    triplet.spinMultiplicity = 3;
    triplet.opticalIsomers = 2;

    PartitionFunctionEvaluator a, b;
    PartitionSettings settings;
    std::string detail;
    ASSERT_EQ(a.prepare(singlet, settings, detail), 0);
    ASSERT_EQ(b.prepare(triplet, settings, detail), 0);

    PartitionTerms ta, tb;
    ASSERT_EQ(a.evaluate(300.0, ta), 0);
    ASSERT_EQ(b.evaluate(300.0, tb), 0);
    EXPECT_NEAR(tb.lnQ - ta.lnQ, std::log(6.0), 1e-12);
    EXPECT_DOUBLE_EQ(tb.dlnQdT, ta.dlnQdT);
}

TEST(PartitionFunctionTest, ModeCombinationRules) {
    std::string detail;
    PartitionSettings settings;
    PartitionFunctionEvaluator partition;

    Conformer twoTranslations = makeAtomConformer(16.0);
    twoTranslations.modes.push_back(IdealGasTranslation{Quantity(16.0, "amu")});
    EXPECT_EQ(partition.prepare(twoTranslations, settings, detail), ErrorCode::kUnsupportedMode);
    EXPECT_FALSE(partition.isPrepared());

    Conformer twoRotors = makeN2H4Conformer();
    LinearRotor linear;
    linear.inertia = Quantity(10.0, "amu*angstrom^2");
    twoRotors.modes.push_back(linear);
    EXPECT_EQ(partition.prepare(twoRotors, settings, detail), ErrorCode::kUnsupportedMode);
}

TEST(PartitionFunctionTest, InvalidTemperature) {
    PartitionFunctionEvaluator partition;
    PartitionTerms terms;
    EXPECT_EQ(partition.evaluate(300.0, terms), ErrorCode::kNoConformer);

    PartitionSettings settings;
    std::string detail;
    ASSERT_EQ(partition.prepare(makeAtomConformer(4.0), settings, detail), 0);
    EXPECT_EQ(partition.evaluate(0.0, terms), ErrorCode::kInvalidTemperature);
    EXPECT_EQ(partition.evaluate(-5.0, terms), ErrorCode::kInvalidTemperature);
    EXPECT_EQ(partition.evaluate(std::nan(""), terms), ErrorCode::kInvalidTemperature);
}

TEST(ThermoEvaluatorTest, SampleKeepsOrder) {
    ThermoEvaluator evaluator;
    PartitionSettings settings;
    settings.dFrequencyScaleFactor = 0.97;
    std::string detail;
    ASSERT_EQ(evaluator.prepare(makeN2H4Conformer(), settings, detail), 0) << detail;

    std::vector<double> temperatures;
    for (double T = 10.0; T <= 3000.0; T += 10.0) {
        temperatures.push_back(T);
    }
    std::vector<ThermoPoint> points;
    ASSERT_EQ(evaluator.sample(temperatures, points, detail), 0) << detail;
    ASSERT_EQ(points.size(), temperatures.size());

    for (std::size_t i = 0; i < points.size(); ++i) {
        EXPECT_DOUBLE_EQ(points[i].dTemperature, temperatures[i]);
        EXPECT_GE(points[i].dHeatCapacity, 0.0);
        if (i > 0) {
            EXPECT_GT(points[i].dEnthalpy, points[i - 1].dEnthalpy);
            EXPECT_GT(points[i].dEntropy, points[i - 1].dEntropy);
        }
    }
    EXPECT_NEAR(points.front().dHeatCapacity, 4.0 * R, 0.05 * R);
    EXPECT_LT(points.back().dHeatCapacity, 15.5 * R);

    auto [cp, info] = evaluator.getHeatCapacity(-1.0);
    EXPECT_EQ(info, ErrorCode::kInvalidTemperature);
    (void)cp;
}
