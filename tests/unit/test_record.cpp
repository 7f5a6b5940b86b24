#include <gtest/gtest.h>
#include <statmech/parser/YamlRecord.hpp>
#include <statmech/util/ErrorCodes.hpp>
#include "SpeciesFixtures.hpp"

using namespace Statmech;
using namespace StatmechTest;

namespace {

const std::string kDataDir = STATMECH_TEST_DATA_DIR;

/// Minimal oxygen-atom record; pieces can be swapped to inject errors
std::string makeRecordText(const std::string& e0 = "{units: kJ/mol, value: 12.5}",
                           const std::string& extraModes = "",
                           const std::string& label = "label: O\n") {
    return label +
           "conformer:\n"
           "  E0: " + e0 + "\n"
           "  modes:\n"
           "  - class: IdealGasTranslation\n"
           "    mass: {units: amu, value: 15.9949}\n" +
           extraModes +
           "  spinMultiplicity: 3\n";
}

const std::string kTorsionHeader =
    "  - class: HinderedRotor\n"
    "    inertia: {units: amu*angstrom^2, value: 1.2}\n"
    "    barrier: {units: kJ/mol, value: 10.0}\n"
    "    symmetry: 3\n";

} // namespace

TEST(YamlRecordParserTest, LoadsN2H4) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;
    ASSERT_EQ(parser.parse(kDataDir + "N2H4.yml", record, detail), 0) << detail;

    EXPECT_EQ(record.label, "N2H4");
    EXPECT_EQ(record.smiles, "NN");
    EXPECT_EQ(record.inchiKey, "OAKJQQAXSVQMHS-UHFFFAOYSA-N");
    EXPECT_DOUBLE_EQ(record.frequencyScaleFactor, 0.97);
    EXPECT_TRUE(record.useHinderedRotors);
    EXPECT_FALSE(record.isTS);

    ASSERT_TRUE(record.conformer.has_value());
    const Conformer& conformer = *record.conformer;
    EXPECT_DOUBLE_EQ(conformer.E0.value(), 89.66936378637556);
    EXPECT_EQ(conformer.E0.units(), "kJ/mol");
    EXPECT_EQ(conformer.atomicNumbers, (std::vector<int>{7, 7, 1, 1, 1, 1}));
    ASSERT_EQ(conformer.modes.size(), 4u);

    const auto& torsion = std::get<HinderedRotor>(conformer.modes[3]);
    EXPECT_EQ(torsion.treatment, TorsionTreatment::Semiclassical);
    EXPECT_EQ(torsion.fourier.rows(), 2u);
    EXPECT_EQ(torsion.fourier.columns(), 5u);

    ASSERT_TRUE(record.energyTransfer.has_value());
    EXPECT_DOUBLE_EQ(record.energyTransfer->n, 0.85);

    ASSERT_TRUE(record.thermo.has_value());
    EXPECT_DOUBLE_EQ(record.thermo->getTmid(), 518.1161610086507);
    EXPECT_NEAR(record.thermo->dCpInf, 128.874316, 1e-9);

    auto [mw, info] = record.getMolecularWeight();
    EXPECT_EQ(info, 0);
    EXPECT_NEAR(mw, 32.04524366207737, 1e-12);
    EXPECT_EQ(record.validate(detail), 0) << detail;
}

TEST(YamlRecordParserTest, MissingFile) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;
    EXPECT_EQ(parser.parse(kDataDir + "does_not_exist.yml", record, detail),
              ErrorCode::kRecordNotFound);
    EXPECT_NE(detail.find("does_not_exist.yml"), std::string::npos);
}

TEST(YamlRecordParserTest, MinimalRecord) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;
    ASSERT_EQ(parser.parseString(makeRecordText(), record, detail), 0) << detail;

    EXPECT_EQ(record.label, "O");
    EXPECT_EQ(record.conformer->spinMultiplicity, 3);
    EXPECT_FALSE(record.thermo.has_value());
    EXPECT_FALSE(record.energyTransfer.has_value());
    EXPECT_DOUBLE_EQ(record.frequencyScaleFactor, 1.0);
    EXPECT_NEAR(record.getMolecularWeight().first, 15.9949, 1e-12);
}

TEST(YamlRecordParserTest, MissingRequiredFields) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;

    std::string noE0 = "label: O\nconformer:\n  modes: []\n";
    EXPECT_EQ(parser.parseString(noE0, record, detail), ErrorCode::kMissingRequiredField);
    EXPECT_NE(detail.find("conformer.E0"), std::string::npos);

    EXPECT_EQ(parser.parseString(makeRecordText("{units: kJ/mol, value: 1.0}", "", ""),
                                 record, detail),
              ErrorCode::kMissingRequiredField);
    EXPECT_NE(detail.find("label"), std::string::npos);

    std::string noFrequencies = makeRecordText("{units: kJ/mol, value: 1.0}",
                                        "  - class: HarmonicOscillator\n");
    EXPECT_EQ(parser.parseString(noFrequencies, record, detail), ErrorCode::kMissingRequiredField);
}

TEST(YamlRecordParserTest, UnitErrors) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;

    EXPECT_EQ(parser.parseString(makeRecordText("{units: K, value: 12.5}"), record, detail),
              ErrorCode::kUnitMismatch);
    EXPECT_NE(detail.find("E0"), std::string::npos);

    EXPECT_EQ(parser.parseString(makeRecordText("{units: furlongs, value: 12.5}"), record, detail),
              ErrorCode::kUnrecognizedUnit);
}

TEST(YamlRecordParserTest, TorsionTreatmentMustBeUnique) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;
    const std::string e0 = "{units: kJ/mol, value: 12.5}";

    std::string both = makeRecordText(e0, kTorsionHeader + "    quantum: true\n"
                                                           "    semiclassical: true\n");
    EXPECT_EQ(parser.parseString(both, record, detail), ErrorCode::kUnsupportedMode);

    std::string neither = makeRecordText(e0, kTorsionHeader);
    EXPECT_EQ(parser.parseString(neither, record, detail), ErrorCode::kUnsupportedMode);

    std::string quantum = makeRecordText(e0, kTorsionHeader + "    quantum: true\n");
    ASSERT_EQ(parser.parseString(quantum, record, detail), 0) << detail;
    EXPECT_EQ(std::get<HinderedRotor>(record.conformer->modes[1]).treatment,
              TorsionTreatment::Quantum);

    std::string unknown = makeRecordText(e0, "  - class: SphericalTopRotor\n");
    EXPECT_EQ(parser.parseString(unknown, record, detail), ErrorCode::kUnsupportedMode);
}

TEST(YamlRecordParserTest, InertiaFromRotationalConstant) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;
    std::string text = makeRecordText(
        "{units: kJ/mol, value: 12.5}",
        "  - class: NonlinearRotor\n"
        "    rotationalConstant:\n"
        "      units: cm^-1\n"
        "      value: [4.8886713918550875, 0.8222762933759231, 0.8217653490032506]\n"
        "    symmetry: 2\n");
    ASSERT_EQ(parser.parseString(text, record, detail), 0) << detail;

    const auto& rotor = std::get<NonlinearRotor>(record.conformer->modes[1]);
    EXPECT_EQ(rotor.inertia.units(), "amu*angstrom^2");
    EXPECT_NEAR(rotor.inertia.values()[0], 3.44830480556223, 1e-5);
    EXPECT_NEAR(rotor.inertia.values()[2], 20.513920517329836, 1e-4);
    EXPECT_EQ(rotor.symmetry, 2);
}

TEST(YamlRecordParserTest, MalformedYaml) {
    YamlRecordParser parser;
    SpeciesRecord record;
    std::string detail;

    EXPECT_EQ(parser.parseString("label: [unclosed\n", record, detail),
              ErrorCode::kInvalidRecordFormat);
    EXPECT_EQ(parser.parseString("- just\n- a list\n", record, detail),
              ErrorCode::kInvalidRecordFormat);
    EXPECT_EQ(parser.parseString(makeRecordText("12.5"), record, detail),
              ErrorCode::kInvalidRecordFormat);
    EXPECT_EQ(parser.parseString(makeRecordText("{units: kJ/mol, value: abc}"), record, detail),
              ErrorCode::kInvalidRecordFormat);
}

TEST(YamlRecordParserTest, Extensions) {
    YamlRecordParser parser;
    EXPECT_TRUE(parser.canParse("N2H4.yml"));
    EXPECT_TRUE(parser.canParse("/tmp/species.yaml"));
    EXPECT_FALSE(parser.canParse("therm.dat"));
    EXPECT_STREQ(parser.getParserName(), "YamlRecordParser");
}

TEST(YamlRecordWriterTest, RoundTripIsExact) {
    YamlRecordParser parser;
    YamlRecordWriter writer;
    SpeciesRecord original;
    std::string detail;
    ASSERT_EQ(parser.parse(kDataDir + "N2H4.yml", original, detail), 0) << detail;

    std::string first;
    ASSERT_EQ(writer.writeString(original, first, detail), 0) << detail;

    SpeciesRecord reread;
    ASSERT_EQ(parser.parseString(first, reread, detail), 0) << detail;

    std::string second;
    ASSERT_EQ(writer.writeString(reread, second, detail), 0) << detail;
    EXPECT_EQ(first, second);

    EXPECT_EQ(reread.conformer->E0.value(), original.conformer->E0.value());
    const auto& a = std::get<HarmonicOscillator>(original.conformer->modes[2]).frequencies;
    const auto& b = std::get<HarmonicOscillator>(reread.conformer->modes[2]).frequencies;
    EXPECT_EQ(a.values(), b.values());
    EXPECT_EQ(reread.thermo->low.coeffs, original.thermo->low.coeffs);
    EXPECT_EQ(reread.thermo->high.coeffs, original.thermo->high.coeffs);
}

TEST(YamlRecordWriterTest, DerivedFieldsRegenerated) {
    YamlRecordParser parser;
    YamlRecordWriter writer;
    SpeciesRecord record;
    std::string detail;

    // Stale renderings in the input are ignored on read
    std::string text = makeRecordText() +
                       "thermo_data: {H298: 999.99 kcal/mol}\n"
                       "chemkin_thermo_string: not a chemkin entry\n"
                       "xyz: nonsense\n";
    ASSERT_EQ(parser.parseString(text, record, detail), 0) << detail;

    ASSERT_EQ(parser.parse(kDataDir + "N2H4.yml", record, detail), 0) << detail;
    std::string output;
    ASSERT_EQ(writer.writeString(record, output, detail), 0) << detail;

    EXPECT_NE(output.find("H298: 24.14 kcal/mol"), std::string::npos);
    EXPECT_NE(output.find("300 K: '11.72'"), std::string::npos);
    EXPECT_NE(output.find("N2H4                    H   4N   2"), std::string::npos);
    EXPECT_NE(output.find("xyz: |"), std::string::npos);
}

TEST(YamlRecordWriterTest, WriteFileAndReadBack) {
    YamlRecordParser parser;
    YamlRecordWriter writer;
    SpeciesRecord record = makeN2H4Record();
    std::string detail;

    std::string path = ::testing::TempDir() + "statmech_writer_test.yml";
    ASSERT_EQ(writer.write(record, path, detail), 0) << detail;

    SpeciesRecord reread;
    ASSERT_EQ(parser.parse(path, reread, detail), 0) << detail;
    EXPECT_EQ(reread.label, "N2H4");
    EXPECT_DOUBLE_EQ(reread.frequencyScaleFactor, 0.97);
    EXPECT_EQ(reread.conformer->modes.size(), 4u);

    EXPECT_EQ(writer.write(record, "/nonexistent-dir/N2H4.yml", detail),
              ErrorCode::kRecordWriteError);
}

TEST(YamlRecordWriterTest, ChemkinOmittedBeyondFourElements) {
    YamlRecordParser parser;
    YamlRecordWriter writer;
    SpeciesRecord record;
    std::string detail;
    ASSERT_EQ(parser.parse(kDataDir + "N2H4.yml", record, detail), 0) << detail;
    record.conformer->atomicNumbers = {6, 1, 7, 8, 17, 9};

    std::string output;
    ASSERT_EQ(writer.writeString(record, output, detail), 0) << detail;
    EXPECT_EQ(output.find("chemkin_thermo_string"), std::string::npos);
    EXPECT_NE(output.find("H298: 24.14 kcal/mol"), std::string::npos);
}
