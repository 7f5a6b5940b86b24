/// @file SpeciesThermo.hpp
/// @brief Object-oriented API for one species
/// @details Owns the species context and the strategy instances (record
/// reader, record writer, Tmid selector) and runs the pipeline.

#pragma once

#include "statmech/SpeciesContext.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <memory>
#include <string>
#include <utility>

namespace Statmech {

// Forward declarations
class IRecordParser;
class IRecordWriter;
class ITmidSelector;

/// @brief Thermodynamic properties and NASA fit of one species
///
/// Example usage:
/// @code
/// SpeciesThermo species;
/// species.loadRecord("N2H4.yml");
/// species.setTmidSearch(true);
/// species.calculate();
/// auto [cp, info] = species.getFittedHeatCapacity(500.0);
/// @endcode
class SpeciesThermo {
public:
    /// @brief Constructor - initializes with default strategies
    SpeciesThermo();

    /// @brief Destructor
    ~SpeciesThermo();

    /// @brief Move constructor
    SpeciesThermo(SpeciesThermo&&) noexcept;

    /// @brief Move assignment
    SpeciesThermo& operator=(SpeciesThermo&&) noexcept;

    // Delete copy operations (SpeciesContext is not copyable)
    SpeciesThermo(const SpeciesThermo&) = delete;
    SpeciesThermo& operator=(const SpeciesThermo&) = delete;

    // =========================================================================
    // Record Loading
    // =========================================================================

    /// @brief Load a species record
    /// @param filename Path to the record
    /// @return Error code (0 = success)
    int loadRecord(const std::string& filename);

    /// @brief Use an in-memory record
    void setRecord(const SpeciesRecord& record);

    /// @brief Write the record with its fitted model
    /// @param filename Output path
    /// @return Error code (0 = success, kRecordWriteError)
    int writeRecord(const std::string& filename);

    /// @brief Set custom record reader
    void setParser(std::unique_ptr<IRecordParser> parser);

    /// @brief Set custom record writer
    void setWriter(std::unique_ptr<IRecordWriter> writer);

    // =========================================================================
    // Input Configuration
    // =========================================================================

    /// @brief Set fit temperature range
    /// @param Tmin Lower bound [K]
    /// @param Tmax Upper bound [K]
    void setTemperatureRange(double Tmin, double Tmax);

    /// @brief Set fixed breakpoint (disables Tmid search)
    /// @param Tmid Breakpoint [K]
    void setTmid(double Tmid);

    /// @brief Enable/disable Tmid search
    void setTmidSearch(bool enable);

    /// @brief Set number of Tmid candidates scored by the search
    void setTmidCandidates(int nCandidates);

    /// @brief Set iteration budget of the Tmid refinement
    void setMaxFitIterations(int maxIter);

    /// @brief Set number of fit samples per polynomial range
    void setSamplePoints(int nPoints);

    /// @brief Set quantum rotor basis half-width
    void setTorsionBasis(int halfWidth);

    /// @brief Set standard-state pressure [Pa]
    void setPressure(double pressure);

    /// @brief Set print results mode
    /// @param mode Print mode (0 = none, 1 = summary, 2 = detailed)
    void setPrintResultsMode(int mode);

    /// @brief Set output directory for rewritten records
    void setOutputFilePath(const std::string& path);

    /// @brief Write <output dir>/<label>.yml after each fit
    void setWriteRecord(bool enable);

    /// @brief Set a tolerance by index (see ToleranceIndex)
    void setTolerance(int index, double value);

    /// @brief Set custom Tmid selection strategy (overrides setTmid/setTmidSearch)
    void setTmidSelector(std::unique_ptr<ITmidSelector> selector);

    // =========================================================================
    // Main Computation
    // =========================================================================

    /// @brief Evaluate the record and fit its NASA model
    /// @return Error code (0 = success, kPoorFitQuality keeps the model)
    int calculate();

    // =========================================================================
    // Output Retrieval
    // =========================================================================

    std::pair<double, int> getHeatCapacity(double T) const;
    std::pair<double, int> getEnthalpy(double T) const;
    std::pair<double, int> getEntropy(double T) const;
    std::pair<double, int> getGibbsEnergy(double T) const;

    std::pair<double, int> getFittedHeatCapacity(double T) const;
    std::pair<double, int> getFittedEnthalpy(double T) const;
    std::pair<double, int> getFittedEntropy(double T) const;

    /// @brief Average downward energy of the collision model [J/mol]
    std::pair<double, int> getAverageDownwardEnergy(double T) const;

    /// @brief Fitted model (nullptr if none)
    const NASA* getNASA() const;

    /// @brief Diagnostics of the last fit
    const NASAFitReport& getFitReport() const { return state_->fitReport; }

    /// @brief Cp/H298/S298 table of the fitted model
    const ThermoTable& getThermoTable() const { return state_->table; }

    /// @brief Chemkin entry of the fitted model (empty if it cannot be written)
    std::string getChemkinEntry() const;

    const SpeciesRecord& getRecord() const { return state_->record; }

    // =========================================================================
    // Status
    // =========================================================================

    int getInfoCode() const { return context_.infoSpecies(); }
    const std::string& getInfoDetail() const { return io_->cInfoDetail; }
    bool isSuccess() const { return context_.isSuccess(); }

    /// @brief Message of the current error code
    const char* getErrorMessage() const { return ErrorCode::getMessage(context_.infoSpecies()); }

    /// @brief Print species summary to stdout
    void printResults() const;

    /// @brief Reset fit state (keeps record and settings)
    void resetFit();

    /// @brief Full reset (strategies are kept)
    void reset();

    SpeciesContext& getContext() { return context_; }
    const SpeciesContext& getContext() const { return context_; }

private:
    SpeciesContext context_;
    SpeciesState* state_;
    SpeciesIO* io_;

    std::unique_ptr<IRecordParser> parser_;
    std::unique_ptr<IRecordWriter> writer_;
    std::unique_ptr<ITmidSelector> selector_;   ///< nullptr: chosen from the settings
};

} // namespace Statmech
