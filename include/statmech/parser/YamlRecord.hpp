/// @file YamlRecord.hpp
/// @brief YAML species record reader and writer (yaml-cpp)
/// @details Every physical field is a mapping {value, units}; arrays carry a
/// sequence (1-D) or a sequence of sequences (2-D) as value. Declared units
/// are checked against the dimension each field requires. The derived
/// renderings (thermo_data, chemkin_thermo_string, xyz) are ignored on read
/// and regenerated on write.

#pragma once

#include "statmech/interfaces/IRecordParser.hpp"
#include "statmech/models/SpeciesRecord.hpp"

namespace Statmech {

class YamlRecordParser : public IRecordParser {
public:
    int parse(const std::string& filename,
              SpeciesRecord& record,
              std::string& detail) const override;

    int parseString(const std::string& text,
                    SpeciesRecord& record,
                    std::string& detail) const override;

    std::vector<std::string> getSupportedExtensions() const override {
        return {".yml", ".yaml"};
    }

    bool canParse(const std::string& filename) const override;

    const char* getParserName() const override { return "YamlRecordParser"; }
};

class YamlRecordWriter : public IRecordWriter {
public:
    int write(const SpeciesRecord& record,
              const std::string& filename,
              std::string& detail) const override;

    int writeString(const SpeciesRecord& record,
                    std::string& text,
                    std::string& detail) const override;

    const char* getWriterName() const override { return "YamlRecordWriter"; }
};

} // namespace Statmech
