#include <gtest/gtest.h>
#include <statmech/solver/NASAFitter.hpp>
#include <statmech/solver/TmidSelectors.hpp>
#include <statmech/util/ErrorCodes.hpp>
#include "SpeciesFixtures.hpp"
#include <cmath>

using namespace Statmech;
using namespace StatmechTest;

namespace {

constexpr double R = Constants::kIdealGasConstant;

class NASAFitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        PartitionSettings settings;
        settings.dFrequencyScaleFactor = 0.97;
        std::string detail;
        ASSERT_EQ(evaluator.prepare(makeN2H4Conformer(), settings, detail), 0) << detail;
        functions = evaluator.functions();
    }

    ThermoEvaluator evaluator;
    ThermoFunctions functions;
    NASAFitter fitter;
};

/// Ideal diatomic-like gas with Cp = 3.5 R
ThermoFunctions constantCpFunctions() {
    ThermoFunctions f;
    f.heatCapacity = [](double) { return 3.5 * R; };
    f.enthalpy = [](double T) { return 1000.0 + 3.5 * R * T; };
    f.entropy = [](double T) { return 3.5 * R * std::log(T) + 50.0; };
    return f;
}

} // namespace

TEST_F(NASAFitterTest, FixedTmidFit) {
    NASA model;
    NASAFitReport report;
    int info = fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(1000.0), model, report);
    ASSERT_EQ(info, 0) << ErrorCode::getMessage(info);

    EXPECT_DOUBLE_EQ(report.dTmid, 1000.0);
    EXPECT_LT(report.dResidual, 0.05);
    EXPECT_LT(report.dContinuityError, 1e-6);
    EXPECT_EQ(model.validate(), 0);

    // Cp and dCp/dT continuous at Tmid
    EXPECT_NEAR(model.low.getHeatCapacity(1000.0), model.high.getHeatCapacity(1000.0), 1e-8);
    double slopeLow = (model.low.getHeatCapacity(1000.5) - model.low.getHeatCapacity(999.5));
    double slopeHigh = (model.high.getHeatCapacity(1000.5) - model.high.getHeatCapacity(999.5));
    EXPECT_NEAR(slopeLow, slopeHigh, 1e-5);

    // The range holding 298.15 K reproduces H and S there
    auto [h298, hInfo] = evaluator.getEnthalpy(298.15);
    auto [s298, sInfo] = evaluator.getEntropy(298.15);
    ASSERT_EQ(hInfo, 0);
    ASSERT_EQ(sInfo, 0);
    EXPECT_NEAR(model.getEnthalpy(298.15).first, h298, 1e-6);
    EXPECT_NEAR(model.getEntropy(298.15).first, s298, 1e-9);
    EXPECT_NEAR(model.getEnthalpy(298.15).first / 4184.0, 24.14, 0.1);
}

TEST_F(NASAFitterTest, FitTracksHeatCapacity) {
    NASA model;
    NASAFitReport report;
    ASSERT_EQ(fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(1000.0), model, report), 0);

    for (double T : {300.0, 800.0, 1500.0, 2500.0}) {
        double exact = functions.heatCapacity(T);
        EXPECT_NEAR(model.getHeatCapacity(T).first, exact, 0.03 * exact) << "T = " << T;
    }
}

TEST_F(NASAFitterTest, InvalidRanges) {
    NASA model;
    NASAFitReport report;
    double residual = 0.0;

    EXPECT_EQ(fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(10.0), model, report),
              ErrorCode::kInvalidFitConfiguration);
    EXPECT_EQ(fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(3000.0), model, report),
              ErrorCode::kInvalidFitConfiguration);
    EXPECT_EQ(fitter.fit(functions, 0.0, 3000.0, FixedTmidSelector(1000.0), model, report),
              ErrorCode::kInvalidFitConfiguration);
    EXPECT_EQ(fitter.fit(functions, 3000.0, 300.0, FixedTmidSelector(1000.0), model, report),
              ErrorCode::kInvalidFitConfiguration);
    EXPECT_EQ(fitter.fitWithTmid(functions, 10.0, 5000.0, 3000.0, model, residual),
              ErrorCode::kInvalidFitConfiguration);
    EXPECT_EQ(NASAFitter::checkRange(-1.0, 100.0, 200.0), ErrorCode::kInvalidFitConfiguration);
    EXPECT_EQ(NASAFitter::checkRange(10.0, 100.0, 200.0), ErrorCode::kSuccess);
}

TEST_F(NASAFitterTest, BreakpointsNearRangeEnds) {
    // Narrow ranges on either side are still well posed
    for (double tmid : {30.0, 50.0, 100.0, 2572.857, 2700.0, 2900.0}) {
        NASA model;
        double residual = 0.0;
        ASSERT_EQ(fitter.fitWithTmid(functions, 10.0, tmid, 3000.0, model, residual), 0)
            << "Tmid = " << tmid;
        EXPECT_TRUE(std::isfinite(residual)) << "Tmid = " << tmid;
        EXPECT_EQ(model.validate(), 0);
        EXPECT_LT(model.getContinuityError(), 1e-6) << "Tmid = " << tmid;

        // The short range follows the sampled heat capacity
        const bool lowIsShort = tmid < 1505.0;
        const NASAPolynomial& shortRange = lowIsShort ? model.low : model.high;
        double T = lowIsShort ? 0.5 * (10.0 + tmid) : 0.5 * (tmid + 3000.0);
        EXPECT_NEAR(shortRange.getHeatCapacity(T), functions.heatCapacity(T),
                    0.01 * functions.heatCapacity(T)) << "Tmid = " << tmid;
    }

    NASA model;
    NASAFitReport report;
    int info = fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(2700.0), model, report);
    EXPECT_TRUE(info == 0 || info == ErrorCode::kPoorFitQuality) << ErrorCode::getMessage(info);
    EXPECT_DOUBLE_EQ(model.getTmid(), 2700.0);
}

TEST_F(NASAFitterTest, MissingFunctions) {
    NASA model;
    NASAFitReport report;
    ThermoFunctions empty;
    EXPECT_FALSE(empty.isValid());
    EXPECT_EQ(fitter.fit(empty, 10.0, 3000.0, FixedTmidSelector(1000.0), model, report),
              ErrorCode::kNoThermoModel);
}

TEST_F(NASAFitterTest, NonFiniteSamplesRejected) {
    ThermoFunctions broken = constantCpFunctions();
    broken.heatCapacity = [](double T) { return T > 2000.0 ? std::nan("") : 3.5 * R; };

    NASA model;
    double residual = 0.0;
    EXPECT_EQ(fitter.fitWithTmid(broken, 100.0, 1000.0, 3000.0, model, residual),
              ErrorCode::kNonPhysicalResult);
}

TEST_F(NASAFitterTest, SearchSelectsInteriorTmid) {
    NASA model;
    NASAFitReport report;
    SearchTmidSelector selector;
    int info = fitter.fit(functions, 10.0, 3000.0, selector, model, report);
    ASSERT_EQ(info, 0) << ErrorCode::getMessage(info);

    EXPECT_GT(report.dTmid, 10.0);
    EXPECT_LT(report.dTmid, 3000.0);
    EXPECT_DOUBLE_EQ(model.getTmid(), report.dTmid);
    EXPECT_GE(report.candidates.size(),
              static_cast<std::size_t>(Constants::kDefaultTmidCandidates));
    EXPECT_GT(report.nIterations, 0);

    // The selected breakpoint is no worse than the fixed 1000 K default
    NASA fixedModel;
    NASAFitReport fixedReport;
    ASSERT_EQ(fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(1000.0), fixedModel,
                         fixedReport), 0);
    EXPECT_LE(report.dResidual, fixedReport.dResidual * 1.01);
}

TEST_F(NASAFitterTest, SearchTiesGoToMiddleOfRange) {
    // Every finite residual counts as a tie
    Tolerances loose;
    loose[kTolTmidTie] = 1.0e6;
    SearchTmidSelector selector(Constants::kDefaultTmidCandidates,
                                Constants::kDefaultMaxFitIterations, loose);

    NASA model;
    NASAFitReport report;
    int info = fitter.fit(functions, 10.0, 3000.0, selector, model, report);
    ASSERT_TRUE(info == 0 || info == ErrorCode::kPoorFitQuality) << ErrorCode::getMessage(info);

    const double middle = 1505.0;
    double closest = report.candidates.front().first;
    for (const auto& candidate : report.candidates) {
        ASSERT_TRUE(std::isfinite(candidate.second)) << "Tmid = " << candidate.first;
        if (std::abs(candidate.first - middle) < std::abs(closest - middle)) {
            closest = candidate.first;
        }
    }
    EXPECT_DOUBLE_EQ(report.dTmid, closest);
}

TEST_F(NASAFitterTest, SearchBudgetExhausted) {
    NASA model;
    NASAFitReport report;
    SearchTmidSelector selector(5, 1);
    EXPECT_EQ(fitter.fit(functions, 10.0, 3000.0, selector, model, report),
              ErrorCode::kFitDidNotConverge);
    EXPECT_EQ(report.nIterations, 1);
}

TEST_F(NASAFitterTest, SearchDiagnosticsFollowPrintMode) {
    NASA model;
    NASAFitReport report;
    SearchTmidSelector selector(5, 1);

    fitter.setPrintMode(0);
    testing::internal::CaptureStderr();
    EXPECT_EQ(fitter.fit(functions, 10.0, 3000.0, selector, model, report),
              ErrorCode::kFitDidNotConverge);
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");

    fitter.setPrintMode(1);
    testing::internal::CaptureStderr();
    EXPECT_EQ(fitter.fit(functions, 10.0, 3000.0, selector, model, report),
              ErrorCode::kFitDidNotConverge);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("[SearchTmidSelector]"),
              std::string::npos);
}

TEST_F(NASAFitterTest, RefitIsDeterministic) {
    NASA first;
    NASA second;
    NASAFitReport report;
    ASSERT_EQ(fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(1000.0), first, report), 0);
    ASSERT_EQ(fitter.fit(functions, 10.0, 3000.0, FixedTmidSelector(1000.0), second, report), 0);

    EXPECT_EQ(first.low.coeffs, second.low.coeffs);
    EXPECT_EQ(first.high.coeffs, second.high.coeffs);
}

TEST(NASAFitterExactTest, ConstantHeatCapacityIsExact) {
    NASAFitter fitter;
    NASA model;
    NASAFitReport report;
    ThermoFunctions f = constantCpFunctions();
    ASSERT_EQ(fitter.fit(f, 100.0, 5000.0, FixedTmidSelector(1000.0), model, report), 0);

    EXPECT_LT(report.dResidual, 1e-8);
    for (const auto* poly : {&model.low, &model.high}) {
        EXPECT_NEAR(poly->coeffs[0], 3.5, 1e-8);
        EXPECT_NEAR(poly->coeffs[1], 0.0, 1e-10);
    }
    EXPECT_NEAR(model.getEnthalpy(298.15).first, f.enthalpy(298.15), 1e-6);
    EXPECT_NEAR(model.getEntropy(4000.0).first, f.entropy(4000.0), 1e-6);
}

TEST(NASAFitterExactTest, TightToleranceReportsPoorFit) {
    PartitionSettings settings;
    ThermoEvaluator evaluator;
    std::string detail;
    ASSERT_EQ(evaluator.prepare(makeN2H4Conformer(), settings, detail), 0) << detail;

    Tolerances tight;
    tight[kTolFitResidual] = 1.0e-8;
    NASAFitter fitter(tight);
    NASA model;
    NASAFitReport report;
    EXPECT_EQ(fitter.fit(evaluator.functions(), 10.0, 3000.0, FixedTmidSelector(1000.0),
                         model, report),
              ErrorCode::kPoorFitQuality);

    // The model is still delivered
    EXPECT_EQ(model.validate(), 0);
    EXPECT_GT(report.dResidual, 1.0e-8);
}
