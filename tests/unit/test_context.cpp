#include <gtest/gtest.h>
#include <statmech/SpeciesContext.hpp>
#include <statmech/Statmech.hpp>
#include <statmech/SpeciesThermo.hpp>
#include <statmech/solver/TmidSelectors.hpp>
#include <statmech/util/ErrorCodes.hpp>
#include "SpeciesFixtures.hpp"

using namespace Statmech;
using namespace StatmechTest;

TEST(ContextTest, Creation) {
    SpeciesContext ctx;

    EXPECT_NE(ctx.species, nullptr);
    EXPECT_NE(ctx.io, nullptr);
}

TEST(ContextTest, InitialState) {
    SpeciesContext ctx;

    EXPECT_EQ(ctx.infoSpecies(), 0);
    EXPECT_TRUE(ctx.isSuccess());
    EXPECT_FALSE(ctx.isRecordLoaded());
    EXPECT_DOUBLE_EQ(ctx.io->dTmin, 10.0);
    EXPECT_DOUBLE_EQ(ctx.io->dTmax, 3000.0);
    EXPECT_DOUBLE_EQ(ctx.io->dTmid, 1000.0);
    EXPECT_FALSE(ctx.io->lTmidSearch);
}

TEST(ContextTest, SetFitSettings) {
    SpeciesThermo species;
    species.setTemperatureRange(300.0, 2500.0);
    species.setTmidSearch(true);
    species.setTmidCandidates(8);
    species.setMaxFitIterations(12);
    species.setSamplePoints(40);
    species.setTorsionBasis(60);

    auto& ctx = species.getContext();
    EXPECT_DOUBLE_EQ(ctx.io->dTmin, 300.0);
    EXPECT_DOUBLE_EQ(ctx.io->dTmax, 2500.0);
    EXPECT_TRUE(ctx.io->lTmidSearch);
    EXPECT_EQ(ctx.io->nTmidCandidates, 8);
    EXPECT_EQ(ctx.io->nMaxFitIterations, 12);
    EXPECT_EQ(ctx.io->nSamplePoints, 40);
    EXPECT_EQ(ctx.io->nTorsionBasis, 60);

    // A fixed breakpoint turns the search off
    species.setTmid(800.0);
    EXPECT_DOUBLE_EQ(ctx.io->dTmid, 800.0);
    EXPECT_FALSE(ctx.io->lTmidSearch);
}

TEST(ContextTest, Reset) {
    SpeciesThermo species;
    species.setRecord(makeN2H4Record());
    species.setTemperatureRange(300.0, 2500.0);
    species.setTolerance(kTolFitResidual, 1.0);
    species.getContext().setInfoSpecies(ErrorCode::kPoorFitQuality, "residual");

    species.reset();

    auto& ctx = species.getContext();
    EXPECT_EQ(ctx.infoSpecies(), 0);
    EXPECT_TRUE(ctx.io->cInfoDetail.empty());
    EXPECT_FALSE(ctx.isRecordLoaded());
    EXPECT_DOUBLE_EQ(ctx.io->dTmin, Constants::kDefaultTmin);
    EXPECT_DOUBLE_EQ(ctx.species->tolerances[kTolFitResidual], 5.0e-2);
}

TEST(ContextTest, MoveKeepsState) {
    SpeciesContext ctx;
    ctx.io->dTmid = 750.0;
    ctx.species->lRecordLoaded = true;

    SpeciesContext moved(std::move(ctx));
    EXPECT_DOUBLE_EQ(moved.io->dTmid, 750.0);
    EXPECT_TRUE(moved.isRecordLoaded());

    SpeciesThermo a;
    a.setTmid(650.0);
    SpeciesThermo b = std::move(a);
    EXPECT_DOUBLE_EQ(b.getContext().io->dTmid, 650.0);
    b.setTmid(700.0);
    EXPECT_DOUBLE_EQ(b.getContext().io->dTmid, 700.0);
}

TEST(ContextTest, OutputRecordPath) {
    SpeciesIO io;
    EXPECT_EQ(io.getOutputRecordPath("N2H4"), "N2H4.yml");

    io.cOutputFilePath = "/tmp/out";
    EXPECT_EQ(io.getOutputRecordPath("N2H4"), "/tmp/out/N2H4.yml");
    EXPECT_EQ(io.getOutputRecordPath("CH2/CH2 (s)"), "/tmp/out/CH2_CH2_(s).yml");

    io.cOutputFilePath = "/tmp/out/";
    EXPECT_EQ(io.getOutputRecordPath(""), "/tmp/out/species.yml");
}

TEST(TolerancesTest, Defaults) {
    Tolerances tol;

    EXPECT_GT(tol[kTolFitResidual], 0.0);
    EXPECT_GT(tol[kTolContinuity], 0.0);
    EXPECT_GT(tol[kTolTmidStep], 0.0);
    EXPECT_DOUBLE_EQ(tol[kTolSingularPivot], 1.0e-14);
}

TEST(ErrorCodeTest, Messages) {
    EXPECT_STREQ(ErrorCode::getMessage(0), "Success");
    EXPECT_STREQ(ErrorCode::getMessage(ErrorCode::kRecordNotFound), "Species record not found");
    EXPECT_STREQ(getErrorMessage(ErrorCode::kPoorFitQuality), "Poor NASA fit quality");
    EXPECT_STREQ(ErrorCode::getMessage(12345), "Unknown error");
}

TEST(PipelineTest, NoRecordLoaded) {
    SpeciesThermo species;
    EXPECT_EQ(species.calculate(), ErrorCode::kNoConformer);
    EXPECT_FALSE(species.isSuccess());
    EXPECT_EQ(species.getNASA(), nullptr);
    EXPECT_EQ(species.getChemkinEntry(), "");
    EXPECT_EQ(species.getHeatCapacity(300.0).second, ErrorCode::kNoThermoModel);
    EXPECT_EQ(species.getFittedHeatCapacity(300.0).second, ErrorCode::kNoThermoModel);
    EXPECT_EQ(species.writeRecord("/tmp/never_written.yml"), ErrorCode::kNoConformer);
}

TEST(PipelineTest, MissingRecordFile) {
    SpeciesThermo species;
    EXPECT_EQ(species.loadRecord("/nonexistent/species.yml"), ErrorCode::kRecordNotFound);
    EXPECT_FALSE(species.getContext().isRecordLoaded());
    EXPECT_FALSE(species.getInfoDetail().empty());
}

TEST(PipelineTest, InvalidSettingsRejected) {
    SpeciesThermo species;
    species.setRecord(makeN2H4Record());

    species.setTemperatureRange(500.0, 400.0);
    EXPECT_EQ(species.calculate(), ErrorCode::kInvalidFitConfiguration);

    species.setTemperatureRange(10.0, 3000.0);
    species.setTmid(5000.0);
    EXPECT_EQ(species.calculate(), ErrorCode::kInvalidFitConfiguration);

    species.setTmid(1000.0);
    species.setPressure(-1.0);
    EXPECT_EQ(species.calculate(), ErrorCode::kInvalidFitConfiguration);

    species.setPressure(1.0e5);
    species.setTorsionBasis(0);
    EXPECT_EQ(species.calculate(), ErrorCode::kInvalidModeParameter);

    species.setTorsionBasis(100);
    species.setSamplePoints(1);
    EXPECT_EQ(species.calculate(), ErrorCode::kInvalidFitConfiguration);
}

TEST(PipelineTest, InvalidConformerReported) {
    SpeciesRecord record = makeN2H4Record();
    std::get<HarmonicOscillator>(record.conformer->modes[2]).frequencies =
        Quantity(std::vector<double>{500.0, -10.0}, "cm^-1");

    SpeciesThermo species;
    species.setRecord(record);
    EXPECT_EQ(species.calculate(), ErrorCode::kInvalidModeParameter);
    EXPECT_NE(species.getInfoDetail().find("mode 2"), std::string::npos);
    EXPECT_EQ(species.getHeatCapacity(300.0).second, ErrorCode::kNoThermoModel);
}

TEST(PipelineTest, CalculateFixedTmid) {
    SpeciesThermo species;
    species.setRecord(makeN2H4Record());
    ASSERT_EQ(species.calculate(), 0) << species.getErrorMessage();

    const NASA* model = species.getNASA();
    ASSERT_NE(model, nullptr);
    EXPECT_DOUBLE_EQ(model->getTmid(), 1000.0);
    EXPECT_NEAR(model->dCp0, 4.0 * Constants::kIdealGasConstant, 1e-12);
    EXPECT_NEAR(model->dCpInf, 15.5 * Constants::kIdealGasConstant, 1e-12);
    EXPECT_NEAR(model->dE0, 89669.36378637556, 1e-6);

    auto& io = *species.getContext().io;
    EXPECT_DOUBLE_EQ(io.dTmidOut, 1000.0);
    EXPECT_LT(io.dFitResidual, 0.05);
    EXPECT_NEAR(io.dH298, 24.14, 0.1);
    EXPECT_GT(io.dCp298, 0.0);

    auto [cp, cpInfo] = species.getHeatCapacity(500.0);
    auto [fitted, fitInfo] = species.getFittedHeatCapacity(500.0);
    ASSERT_EQ(cpInfo, 0);
    ASSERT_EQ(fitInfo, 0);
    EXPECT_NEAR(fitted, cp, 0.03 * cp);

    auto [g, gInfo] = species.getGibbsEnergy(500.0);
    EXPECT_EQ(gInfo, 0);
    EXPECT_NEAR(g, species.getEnthalpy(500.0).first - 500.0 * species.getEntropy(500.0).first,
                1e-6);

    EXPECT_EQ(species.getThermoTable().heatCapacities.size(), 9u);
    EXPECT_FALSE(species.getChemkinEntry().empty());
}

TEST(PipelineTest, ResetFitKeepsRecord) {
    SpeciesThermo species;
    species.setRecord(makeN2H4Record());
    ASSERT_EQ(species.calculate(), 0);

    species.resetFit();
    EXPECT_TRUE(species.getContext().isRecordLoaded());
    EXPECT_EQ(species.getHeatCapacity(300.0).second, ErrorCode::kNoThermoModel);
    EXPECT_DOUBLE_EQ(species.getContext().io->dTmidOut, 0.0);
    EXPECT_FALSE(species.getContext().species->lFitAvailable);

    // The pipeline can run again on the same record
    EXPECT_EQ(species.calculate(), 0);
}

TEST(PipelineTest, ToleranceSurvivesRecordLoad) {
    SpeciesThermo species;
    species.setTolerance(kTolFitResidual, 1.0e-8);
    species.setRecord(makeN2H4Record());

    // Poor quality still delivers the model
    EXPECT_EQ(species.calculate(), ErrorCode::kPoorFitQuality);
    EXPECT_NE(species.getNASA(), nullptr);
    EXPECT_TRUE(species.getContext().species->lFitAvailable);
    EXPECT_GT(species.getContext().io->dH298, 0.0);
}

TEST(PipelineTest, CustomSelector) {
    SpeciesThermo species;
    species.setRecord(makeN2H4Record());
    species.setTmidSelector(std::make_unique<FixedTmidSelector>(700.0));
    species.setTmid(1200.0);

    ASSERT_EQ(species.calculate(), 0) << species.getErrorMessage();
    EXPECT_DOUBLE_EQ(species.getNASA()->getTmid(), 700.0);
}

TEST(PipelineTest, AverageDownwardEnergy) {
    SpeciesThermo species;
    EXPECT_EQ(species.getAverageDownwardEnergy(300.0).second,
              ErrorCode::kInvalidEnergyTransfer);

    species.setRecord(makeN2H4Record());
    auto [dE, info] = species.getAverageDownwardEnergy(300.0);
    EXPECT_EQ(info, 0);
    EXPECT_NEAR(dE, 3588.6, 1e-9);
}

TEST(PipelineTest, FreeFunctionPipeline) {
    SpeciesContext ctx;
    setRecord(ctx, makeN2H4Record());
    setTmid(ctx, 800.0);
    statmech(ctx);
    ASSERT_TRUE(ctx.isSuccess()) << getErrorMessage(ctx.infoSpecies());
    EXPECT_DOUBLE_EQ(ctx.io->dTmidOut, 800.0);

    resetAll(ctx);
    EXPECT_FALSE(ctx.isRecordLoaded());
}
