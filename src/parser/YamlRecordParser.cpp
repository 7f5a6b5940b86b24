#include "statmech/parser/YamlRecord.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Statmech {

namespace {

/// Structural problem with a known error code
class RecordError : public std::runtime_error {
public:
    RecordError(int code, const std::string& what) : std::runtime_error(what), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

YAML::Node require(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = node[key];
    if (!child) {
        throw RecordError(ErrorCode::kMissingRequiredField,
                          "missing required field '" + path + key + "'");
    }
    return child;
}

template <typename T>
T readOr(const YAML::Node& node, const std::string& key, const T& fallback) {
    YAML::Node child = node[key];
    return (child && !child.IsNull()) ? child.as<T>() : fallback;
}

/// Read {value, units} and check the dimension
Quantity readQuantity(const YAML::Node& node, const std::string& field, const Dimension& dimension) {
    if (!node.IsMap() || !node["value"]) {
        throw RecordError(ErrorCode::kInvalidRecordFormat,
                          field + " is not a {value, units} mapping");
    }
    std::string units = readOr<std::string>(node, "units", "");
    YAML::Node value = node["value"];

    Quantity q;
    if (value.IsSequence()) {
        if (value.size() > 0 && value[0].IsSequence()) {
            q = Quantity::fromRows(value.as<std::vector<std::vector<double>>>(), units);
        } else {
            q = Quantity(value.as<std::vector<double>>(), units);
        }
    } else {
        q = Quantity(value.as<double>(), units);
    }
    q.requireDimension(dimension, field);
    return q;
}

std::string getClass(const YAML::Node& node, const std::string& path) {
    return require(node, "class", path).as<std::string>();
}

/// Moment of inertia, or the one implied by a rotational constant
Quantity readInertia(const YAML::Node& node, const std::string& field) {
    if (node["inertia"]) {
        return readQuantity(node["inertia"], field + ".inertia", Dimensions::kMomentOfInertia);
    }
    if (node["rotationalConstant"]) {
        Quantity b = readQuantity(node["rotationalConstant"], field + ".rotationalConstant",
                                  Dimensions::kWavenumber);
        // I = h / (8 pi^2 c B) with B in m^-1
        std::vector<double> inertia;
        for (double v : b.valuesSI()) {
            inertia.push_back(Constants::kPlanck /
                              (8.0 * Constants::kPi * Constants::kPi * Constants::kSpeedOfLight * v));
        }
        Quantity si = b.isArray() ? Quantity(std::move(inertia), "kg*m^2")
                                  : Quantity(inertia.front(), "kg*m^2");
        return si.convertTo("amu*angstrom^2");
    }
    throw RecordError(ErrorCode::kMissingRequiredField,
                      "missing required field '" + field + ".inertia'");
}

Mode readMode(const YAML::Node& node, std::size_t index) {
    const std::string field = "conformer.modes[" + std::to_string(index) + "]";
    const std::string cls = getClass(node, field + ".");

    if (cls == "IdealGasTranslation") {
        IdealGasTranslation mode;
        mode.mass = readQuantity(require(node, "mass", field + "."), field + ".mass",
                                 Dimensions::kMass);
        return mode;
    }
    if (cls == "NonlinearRotor") {
        NonlinearRotor mode;
        mode.inertia = readInertia(node, field);
        mode.symmetry = readOr<int>(node, "symmetry", 1);
        return mode;
    }
    if (cls == "LinearRotor") {
        LinearRotor mode;
        mode.inertia = readInertia(node, field);
        mode.symmetry = readOr<int>(node, "symmetry", 1);
        return mode;
    }
    if (cls == "HarmonicOscillator") {
        HarmonicOscillator mode;
        mode.frequencies = readQuantity(require(node, "frequencies", field + "."),
                                        field + ".frequencies", Dimensions::kWavenumber);
        return mode;
    }
    if (cls == "HinderedRotor") {
        HinderedRotor mode;
        mode.inertia = readInertia(node, field);
        mode.symmetry = readOr<int>(node, "symmetry", 1);
        if (node["fourier"]) {
            mode.fourier = readQuantity(node["fourier"], field + ".fourier",
                                        Dimensions::kMolarEnergy);
        } else if (node["barrier"]) {
            mode.barrier = readQuantity(node["barrier"], field + ".barrier",
                                        Dimensions::kMolarEnergy);
        } else {
            throw RecordError(ErrorCode::kMissingRequiredField,
                              "missing required field '" + field + ".fourier' or '.barrier'");
        }
        bool quantum = readOr<bool>(node, "quantum", false);
        bool semiclassical = readOr<bool>(node, "semiclassical", false);
        if (quantum == semiclassical) {
            throw RecordError(ErrorCode::kUnsupportedMode,
                              field + ": exactly one of quantum/semiclassical must be true");
        }
        mode.treatment = quantum ? TorsionTreatment::Quantum : TorsionTreatment::Semiclassical;
        return mode;
    }
    throw RecordError(ErrorCode::kUnsupportedMode, field + ": unsupported mode class '" + cls + "'");
}

Conformer readConformer(const YAML::Node& node) {
    Conformer conformer;
    conformer.E0 = readQuantity(require(node, "E0", "conformer."), "conformer.E0",
                                Dimensions::kMolarEnergy);
    if (node["coordinates"]) {
        conformer.coordinates = readQuantity(node["coordinates"], "conformer.coordinates",
                                             Dimensions::kLength);
    }
    if (node["mass"]) {
        conformer.mass = readQuantity(node["mass"], "conformer.mass", Dimensions::kMass);
    }
    if (node["number"]) {
        Quantity numbers = readQuantity(node["number"], "conformer.number",
                                        Dimensions::kDimensionless);
        for (double z : numbers.values()) {
            conformer.atomicNumbers.push_back(static_cast<int>(std::lround(z)));
        }
    }

    YAML::Node modes = require(node, "modes", "conformer.");
    if (!modes.IsSequence()) {
        throw RecordError(ErrorCode::kInvalidRecordFormat, "conformer.modes is not a sequence");
    }
    for (std::size_t i = 0; i < modes.size(); ++i) {
        conformer.modes.push_back(readMode(modes[i], i));
    }
    conformer.opticalIsomers = readOr<int>(node, "opticalIsomers", 1);
    conformer.spinMultiplicity = readOr<int>(node, "spinMultiplicity", 1);
    return conformer;
}

SingleExponentialDown readEnergyTransfer(const YAML::Node& node) {
    std::string cls = getClass(node, "energy_transfer_model.");
    if (cls != "SingleExponentialDown") {
        throw RecordError(ErrorCode::kInvalidEnergyTransfer,
                          "unsupported energy transfer model '" + cls + "'");
    }
    SingleExponentialDown model;
    model.alpha0 = readQuantity(require(node, "alpha0", "energy_transfer_model."),
                                "energy_transfer_model.alpha0", Dimensions::kMolarEnergy);
    model.T0 = readQuantity(require(node, "T0", "energy_transfer_model."),
                            "energy_transfer_model.T0", Dimensions::kTemperature);
    model.n = readOr<double>(node, "n", 0.0);
    return model;
}

NASAPolynomial readPolynomial(const YAML::Node& node, const std::string& field) {
    NASAPolynomial poly;
    std::vector<double> coeffs = require(node, "coeffs", field + ".").as<std::vector<double>>();
    if (coeffs.size() != Constants::kNumNASACoeff) {
        throw RecordError(ErrorCode::kInvalidRecordFormat,
                          field + ".coeffs must hold 7 coefficients");
    }
    std::copy(coeffs.begin(), coeffs.end(), poly.coeffs.begin());
    poly.dTmin = readQuantity(require(node, "Tmin", field + "."), field + ".Tmin",
                              Dimensions::kTemperature).valueIn("K");
    poly.dTmax = readQuantity(require(node, "Tmax", field + "."), field + ".Tmax",
                              Dimensions::kTemperature).valueIn("K");
    return poly;
}

NASA readNASA(const YAML::Node& node) {
    std::string cls = getClass(node, "thermo.");
    if (cls != "NASA") {
        throw RecordError(ErrorCode::kNoThermoModel, "unsupported thermo model '" + cls + "'");
    }
    YAML::Node polys = require(node, "polynomials", "thermo.");
    std::vector<NASAPolynomial> ranges;
    for (const auto& entry : polys) {
        ranges.push_back(readPolynomial(entry.second, "thermo.polynomials." +
                                                      entry.first.as<std::string>()));
    }
    if (ranges.size() != 2) {
        throw RecordError(ErrorCode::kInvalidRecordFormat,
                          "thermo.polynomials must hold exactly two ranges");
    }
    std::sort(ranges.begin(), ranges.end(),
              [](const NASAPolynomial& a, const NASAPolynomial& b) { return a.dTmin < b.dTmin; });

    NASA model;
    model.low = ranges[0];
    model.high = ranges[1];
    if (node["E0"]) {
        model.dE0 = readQuantity(node["E0"], "thermo.E0", Dimensions::kMolarEnergy).valueIn("J/mol");
    }
    if (node["Cp0"]) {
        model.dCp0 = readQuantity(node["Cp0"], "thermo.Cp0",
                                  Dimensions::kMolarHeatCapacity).valueIn("J/(mol*K)");
    }
    if (node["CpInf"]) {
        model.dCpInf = readQuantity(node["CpInf"], "thermo.CpInf",
                                    Dimensions::kMolarHeatCapacity).valueIn("J/(mol*K)");
    }
    if (model.validate() != 0) {
        throw RecordError(ErrorCode::kInvalidRecordFormat,
                          "thermo polynomials do not cover contiguous ranges");
    }
    return model;
}

void readRecord(const YAML::Node& root, SpeciesRecord& record) {
    if (!root.IsMap()) {
        throw RecordError(ErrorCode::kInvalidRecordFormat, "record is not a mapping");
    }
    record = SpeciesRecord{};
    record.label = require(root, "label", "").as<std::string>();
    record.smiles = readOr<std::string>(root, "smiles", "");
    record.inchi = readOr<std::string>(root, "inchi", "");
    record.inchiKey = readOr<std::string>(root, "inchi_key", "");
    record.adjacencyList = readOr<std::string>(root, "adjacency_list", "");
    record.datetime = readOr<std::string>(root, "datetime", "");
    record.generatorVersion = readOr<std::string>(root, "RMG_version", "");
    record.isTS = readOr<bool>(root, "is_ts", false);
    record.useBondCorrections = readOr<bool>(root, "use_bond_corrections", false);
    record.frequencyScaleFactor = readOr<double>(root, "frequency_scale_factor", 1.0);
    record.useHinderedRotors = readOr<bool>(root, "use_hindered_rotors", true);

    if (root["molecular_weight"]) {
        record.molecularWeight = readQuantity(root["molecular_weight"], "molecular_weight",
                                              Dimensions::kMass);
    }
    record.conformer = readConformer(require(root, "conformer", ""));
    if (root["energy_transfer_model"]) {
        record.energyTransfer = readEnergyTransfer(root["energy_transfer_model"]);
    }
    if (root["thermo"]) {
        record.thermo = readNASA(root["thermo"]);
    }
}

/// Convert everything a record read can throw into an error code
template <typename Load>
int readGuarded(Load load, SpeciesRecord& record, std::string& detail) {
    try {
        readRecord(load(), record);
    } catch (const RecordError& e) {
        detail = e.what();
        return e.code();
    } catch (const UnitMismatchError& e) {
        detail = e.what();
        return ErrorCode::kUnitMismatch;
    } catch (const UnrecognizedUnitError& e) {
        detail = e.what();
        return ErrorCode::kUnrecognizedUnit;
    } catch (const YAML::BadFile& e) {
        detail = e.what();
        return ErrorCode::kRecordNotFound;
    } catch (const YAML::Exception& e) {
        detail = e.what();
        return ErrorCode::kInvalidRecordFormat;
    } catch (const std::invalid_argument& e) {
        detail = e.what();
        return ErrorCode::kInvalidRecordFormat;
    }
    return ErrorCode::kSuccess;
}

} // namespace

int YamlRecordParser::parse(const std::string& filename,
                            SpeciesRecord& record,
                            std::string& detail) const {
    int info = readGuarded([&filename]() { return YAML::LoadFile(filename); }, record, detail);
    if (info == ErrorCode::kRecordNotFound) {
        detail = "cannot open record '" + filename + "'";
    }
    return info;
}

int YamlRecordParser::parseString(const std::string& text,
                                  SpeciesRecord& record,
                                  std::string& detail) const {
    return readGuarded([&text]() { return YAML::Load(text); }, record, detail);
}

bool YamlRecordParser::canParse(const std::string& filename) const {
    for (const auto& ext : getSupportedExtensions()) {
        if (filename.size() >= ext.size() &&
            filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace Statmech
