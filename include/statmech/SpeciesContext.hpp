#pragma once

#include <memory>
#include "context/SpeciesState.hpp"
#include "context/SpeciesIO.hpp"

namespace Statmech {

/// Context object holding everything one species computation touches
/// Pass SpeciesContext& to the pipeline functions
class SpeciesContext {
public:
    /// Species record, evaluator and fit products
    std::unique_ptr<SpeciesState> species;

    /// Settings and scalar outputs
    std::unique_ptr<SpeciesIO> io;

    /// Constructor - initializes all state objects
    SpeciesContext();

    /// Destructor
    ~SpeciesContext();

    /// Move constructor
    SpeciesContext(SpeciesContext&&) noexcept;

    /// Move assignment
    SpeciesContext& operator=(SpeciesContext&&) noexcept;

    // Deleted copy operations (context is not copyable)
    SpeciesContext(const SpeciesContext&) = delete;
    SpeciesContext& operator=(const SpeciesContext&) = delete;

    /// Get the current error/info code
    int infoSpecies() const { return io->INFOSpecies; }

    /// Set the error/info code
    void setInfoSpecies(int code) { io->INFOSpecies = code; }

    /// Set the error/info code with the offending field
    void setInfoSpecies(int code, const std::string& detail) {
        io->INFOSpecies = code;
        io->cInfoDetail = detail;
    }

    /// Check if computation was successful
    bool isSuccess() const { return io->INFOSpecies == 0; }

    /// Reset fit state for a new calculation (keeps record and settings)
    void resetFit();

    /// Full reset including record and settings
    void resetAll();

    /// Check if a record is loaded
    bool isRecordLoaded() const { return species->lRecordLoaded; }
};

} // namespace Statmech
