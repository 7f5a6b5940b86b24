/// @file IRecordParser.hpp
/// @brief Interfaces for species record readers and writers
/// @details Implementations handle different record formats:
/// - YamlRecordParser / YamlRecordWriter: YAML species records

#pragma once

#include <string>
#include <vector>

namespace Statmech {

// Forward declarations
struct SpeciesRecord;

/// @brief Abstract interface for species record parsers
class IRecordParser {
public:
    virtual ~IRecordParser() = default;

    /// @brief Parse a record file
    /// @param filename Path to the record
    /// @param record Output record
    /// @param detail Output: description of the first problem found
    /// @return Error code (0 = success, kRecordNotFound, kMissingRequiredField,
    ///         kInvalidRecordFormat, kUnitMismatch, kUnrecognizedUnit, kUnsupportedMode)
    virtual int parse(const std::string& filename,
                      SpeciesRecord& record,
                      std::string& detail) const = 0;

    /// @brief Parse a record held in memory
    virtual int parseString(const std::string& text,
                            SpeciesRecord& record,
                            std::string& detail) const = 0;

    /// @brief Get supported file extensions
    virtual std::vector<std::string> getSupportedExtensions() const = 0;

    /// @brief Check if parser can handle this file
    virtual bool canParse(const std::string& filename) const = 0;

    /// @brief Get parser name for logging
    virtual const char* getParserName() const = 0;
};

/// @brief Abstract interface for species record writers
class IRecordWriter {
public:
    virtual ~IRecordWriter() = default;

    /// @brief Write a record file, regenerating derived renderings
    /// @return Error code (0 = success, kRecordWriteError)
    virtual int write(const SpeciesRecord& record,
                      const std::string& filename,
                      std::string& detail) const = 0;

    /// @brief Render a record to text
    virtual int writeString(const SpeciesRecord& record,
                            std::string& text,
                            std::string& detail) const = 0;

    /// @brief Get writer name for logging
    virtual const char* getWriterName() const = 0;
};

} // namespace Statmech
