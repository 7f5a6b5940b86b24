#include "statmech/parser/YamlRecord.hpp"
#include "statmech/postprocess/ChemkinEntry.hpp"
#include "statmech/postprocess/ThermoTable.hpp"
#include "statmech/util/ElementData.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace Statmech {

namespace {

void emitQuantity(YAML::Emitter& out, const Quantity& q) {
    if (!q.isArray()) {
        out << YAML::Flow << YAML::BeginMap
            << YAML::Key << "class" << YAML::Value << "ScalarQuantity"
            << YAML::Key << "units" << YAML::Value << q.units()
            << YAML::Key << "value" << YAML::Value << q.value()
            << YAML::EndMap;
        return;
    }
    out << YAML::BeginMap;
    out << YAML::Key << "class" << YAML::Value << "ArrayQuantity";
    if (!q.units().empty()) {
        out << YAML::Key << "units" << YAML::Value << q.units();
    }
    out << YAML::Key << "value" << YAML::Value;
    if (q.is2D()) {
        out << YAML::BeginSeq;
        for (std::size_t r = 0; r < q.rows(); ++r) {
            out << YAML::Flow << q.row(r);
        }
        out << YAML::EndSeq;
    } else {
        out << YAML::Flow << q.values();
    }
    out << YAML::EndMap;
}

void emitMode(YAML::Emitter& out, const Mode& mode) {
    out << YAML::BeginMap;
    out << YAML::Key << "class" << YAML::Value << getModeName(mode);

    if (const auto* m = std::get_if<IdealGasTranslation>(&mode)) {
        out << YAML::Key << "mass" << YAML::Value;
        emitQuantity(out, m->mass);
        out << YAML::Key << "quantum" << YAML::Value << false;
    } else if (const auto* m = std::get_if<NonlinearRotor>(&mode)) {
        out << YAML::Key << "inertia" << YAML::Value;
        emitQuantity(out, m->inertia);
        out << YAML::Key << "quantum" << YAML::Value << false;
        out << YAML::Key << "rotationalConstant" << YAML::Value;
        emitQuantity(out, getRotationalConstants(*m));
        out << YAML::Key << "symmetry" << YAML::Value << m->symmetry;
    } else if (const auto* m = std::get_if<LinearRotor>(&mode)) {
        out << YAML::Key << "inertia" << YAML::Value;
        emitQuantity(out, m->inertia);
        out << YAML::Key << "quantum" << YAML::Value << false;
        out << YAML::Key << "rotationalConstant" << YAML::Value;
        emitQuantity(out, getRotationalConstant(*m));
        out << YAML::Key << "symmetry" << YAML::Value << m->symmetry;
    } else if (const auto* m = std::get_if<HarmonicOscillator>(&mode)) {
        out << YAML::Key << "frequencies" << YAML::Value;
        emitQuantity(out, m->frequencies);
        out << YAML::Key << "quantum" << YAML::Value << true;
    } else if (const auto* m = std::get_if<HinderedRotor>(&mode)) {
        if (m->hasFourier()) {
            out << YAML::Key << "fourier" << YAML::Value;
            emitQuantity(out, m->fourier);
        } else {
            out << YAML::Key << "barrier" << YAML::Value;
            emitQuantity(out, m->barrier);
        }
        out << YAML::Key << "frequency" << YAML::Value << getTorsionalFrequency(*m);
        out << YAML::Key << "inertia" << YAML::Value;
        emitQuantity(out, m->inertia);
        out << YAML::Key << "quantum" << YAML::Value
            << (m->treatment == TorsionTreatment::Quantum);
        out << YAML::Key << "rotationalConstant" << YAML::Value;
        emitQuantity(out, getRotationalConstant(*m));
        out << YAML::Key << "semiclassical" << YAML::Value
            << (m->treatment == TorsionTreatment::Semiclassical);
        out << YAML::Key << "symmetry" << YAML::Value << m->symmetry;
    }
    out << YAML::EndMap;
}

void emitConformer(YAML::Emitter& out, const Conformer& conformer) {
    out << YAML::BeginMap;
    out << YAML::Key << "E0" << YAML::Value;
    emitQuantity(out, conformer.E0);
    out << YAML::Key << "class" << YAML::Value << "Conformer";
    if (conformer.hasGeometry()) {
        out << YAML::Key << "coordinates" << YAML::Value;
        emitQuantity(out, conformer.coordinates);
        out << YAML::Key << "mass" << YAML::Value;
        emitQuantity(out, conformer.mass);
    }
    out << YAML::Key << "modes" << YAML::Value << YAML::BeginSeq;
    for (const auto& mode : conformer.modes) {
        emitMode(out, mode);
    }
    out << YAML::EndSeq;
    if (!conformer.atomicNumbers.empty()) {
        std::vector<double> numbers(conformer.atomicNumbers.begin(), conformer.atomicNumbers.end());
        out << YAML::Key << "number" << YAML::Value;
        emitQuantity(out, Quantity(std::move(numbers), ""));
    }
    out << YAML::Key << "opticalIsomers" << YAML::Value << conformer.opticalIsomers;
    out << YAML::Key << "spinMultiplicity" << YAML::Value << conformer.spinMultiplicity;
    out << YAML::EndMap;
}

void emitPolynomial(YAML::Emitter& out, const NASAPolynomial& poly) {
    out << YAML::BeginMap;
    out << YAML::Key << "Tmax" << YAML::Value;
    emitQuantity(out, Quantity(poly.dTmax, "K"));
    out << YAML::Key << "Tmin" << YAML::Value;
    emitQuantity(out, Quantity(poly.dTmin, "K"));
    out << YAML::Key << "class" << YAML::Value << "NASAPolynomial";
    std::vector<double> coeffs(poly.coeffs.begin(), poly.coeffs.end());
    out << YAML::Key << "coeffs" << YAML::Value << YAML::Flow << coeffs;
    out << YAML::EndMap;
}

void emitNASA(YAML::Emitter& out, const NASA& model) {
    out << YAML::BeginMap;
    out << YAML::Key << "Cp0" << YAML::Value;
    emitQuantity(out, Quantity(model.dCp0, "J/(mol*K)"));
    out << YAML::Key << "CpInf" << YAML::Value;
    emitQuantity(out, Quantity(model.dCpInf, "J/(mol*K)"));
    out << YAML::Key << "E0" << YAML::Value;
    emitQuantity(out, Quantity(model.dE0, "J/mol"));
    out << YAML::Key << "Tmax" << YAML::Value;
    emitQuantity(out, Quantity(model.getTmax(), "K"));
    out << YAML::Key << "Tmin" << YAML::Value;
    emitQuantity(out, Quantity(model.getTmin(), "K"));
    out << YAML::Key << "class" << YAML::Value << "NASA";
    out << YAML::Key << "polynomials" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "polynomial1" << YAML::Value;
    emitPolynomial(out, model.low);
    out << YAML::Key << "polynomial2" << YAML::Value;
    emitPolynomial(out, model.high);
    out << YAML::EndMap;
    out << YAML::EndMap;
}

void emitThermoTable(YAML::Emitter& out, const ThermoTable& table) {
    auto fixed2 = [](double v) {
        std::ostringstream s;
        s << std::fixed << std::setprecision(2) << v;
        return s.str();
    };
    out << YAML::BeginMap;
    out << YAML::Key << "Cp (cal/mol*K)" << YAML::Value << YAML::Flow << YAML::BeginMap;
    for (const auto& [T, cp] : table.heatCapacities) {
        std::ostringstream key;
        key << T << " K";
        out << YAML::Key << key.str() << YAML::Value << YAML::SingleQuoted << fixed2(cp);
    }
    out << YAML::EndMap;
    out << YAML::Key << "H298" << YAML::Value << fixed2(table.dH298) + " kcal/mol";
    out << YAML::Key << "S298" << YAML::Value << fixed2(table.dS298) + " cal/mol*K";
    out << YAML::EndMap;
}

std::string renderXYZ(const SpeciesRecord& record) {
    const Conformer& conformer = *record.conformer;
    Quantity xyz = conformer.coordinates.convertTo("angstroms");
    std::ostringstream s;
    s << conformer.getAtomCount() << '\n' << record.label;
    s << std::setprecision(10);
    for (std::size_t i = 0; i < xyz.rows(); ++i) {
        s << '\n' << (i < conformer.atomicNumbers.size() ? getElementSymbol(conformer.atomicNumbers[i]) : "X");
        for (std::size_t c = 0; c < 3; ++c) {
            s << ' ' << xyz.at(i, c);
        }
    }
    return s.str();
}

} // namespace

int YamlRecordWriter::writeString(const SpeciesRecord& record,
                                  std::string& text,
                                  std::string& detail) const {
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);

    out << YAML::BeginMap;
    if (!record.generatorVersion.empty()) {
        out << YAML::Key << "RMG_version" << YAML::Value << record.generatorVersion;
    }
    if (!record.adjacencyList.empty()) {
        out << YAML::Key << "adjacency_list" << YAML::Value << YAML::Literal << record.adjacencyList;
    }

    std::string chemkin;
    ThermoTable table;
    bool hasTable = false;
    if (record.thermo) {
        std::map<std::string, int> elements;
        if (record.conformer) {
            elements = countElements(record.conformer->atomicNumbers);
        }
        hasTable = (buildThermoTable(*record.thermo, table) == 0);
        // The composition is in the conformer; only the fixed-column entry is omitted
        if (writeChemkinEntry(record.label, elements, *record.thermo, chemkin) == 0) {
            out << YAML::Key << "chemkin_thermo_string" << YAML::Value << YAML::Literal
                << chemkin;
        }
    }

    out << YAML::Key << "class" << YAML::Value << "ArkaneSpecies";
    if (record.conformer) {
        out << YAML::Key << "conformer" << YAML::Value;
        emitConformer(out, *record.conformer);
    }
    if (!record.datetime.empty()) {
        out << YAML::Key << "datetime" << YAML::Value << record.datetime;
    }
    if (record.energyTransfer) {
        const auto& et = *record.energyTransfer;
        out << YAML::Key << "energy_transfer_model" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "T0" << YAML::Value;
        emitQuantity(out, et.T0);
        out << YAML::Key << "alpha0" << YAML::Value;
        emitQuantity(out, et.alpha0);
        out << YAML::Key << "class" << YAML::Value << "SingleExponentialDown";
        out << YAML::Key << "n" << YAML::Value << et.n;
        out << YAML::EndMap;
    }
    out << YAML::Key << "frequency_scale_factor" << YAML::Value << record.frequencyScaleFactor;
    if (!record.inchi.empty()) {
        out << YAML::Key << "inchi" << YAML::Value << record.inchi;
    }
    if (!record.inchiKey.empty()) {
        out << YAML::Key << "inchi_key" << YAML::Value << record.inchiKey;
    }
    out << YAML::Key << "is_ts" << YAML::Value << record.isTS;
    out << YAML::Key << "label" << YAML::Value << record.label;
    if (record.molecularWeight) {
        out << YAML::Key << "molecular_weight" << YAML::Value;
        emitQuantity(out, *record.molecularWeight);
    }
    if (!record.smiles.empty()) {
        out << YAML::Key << "smiles" << YAML::Value << record.smiles;
    }
    if (record.thermo) {
        out << YAML::Key << "thermo" << YAML::Value;
        emitNASA(out, *record.thermo);
    }
    if (hasTable) {
        out << YAML::Key << "thermo_data" << YAML::Value;
        emitThermoTable(out, table);
    }
    out << YAML::Key << "use_bond_corrections" << YAML::Value << record.useBondCorrections;
    out << YAML::Key << "use_hindered_rotors" << YAML::Value << record.useHinderedRotors;
    if (record.conformer && record.conformer->hasGeometry()) {
        out << YAML::Key << "xyz" << YAML::Value << YAML::Literal << renderXYZ(record);
    }
    out << YAML::EndMap;

    if (!out.good()) {
        detail = "YAML emitter error: " + out.GetLastError();
        return ErrorCode::kRecordWriteError;
    }
    text = out.c_str();
    text += '\n';
    return ErrorCode::kSuccess;
}

int YamlRecordWriter::write(const SpeciesRecord& record,
                            const std::string& filename,
                            std::string& detail) const {
    std::string text;
    int info = writeString(record, text, detail);
    if (info != 0) {
        return info;
    }
    std::ofstream file(filename);
    if (!file) {
        detail = "cannot open '" + filename + "' for writing";
        return ErrorCode::kRecordWriteError;
    }
    file << text;
    if (!file) {
        detail = "write to '" + filename + "' failed";
        return ErrorCode::kRecordWriteError;
    }
    return ErrorCode::kSuccess;
}

} // namespace Statmech
