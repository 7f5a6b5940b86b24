/// @file Quantity.hpp
/// @brief Unit-tagged physical values (scalar, 1-D or 2-D arrays)
/// @details A Quantity keeps the value(s) exactly as supplied together with the
/// unit string. The dimension is resolved from the unit registry when the
/// Quantity is built; unknown units are rejected. Arithmetic never rescales:
/// sums require the identical unit, and conversion is always explicit.

#pragma once

#include "statmech/util/Units.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace Statmech {

/// @brief Raised when two Quantities (or a Quantity and an expected
/// dimension) are dimensionally incompatible
class UnitMismatchError : public std::runtime_error {
public:
    explicit UnitMismatchError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief Raised when a unit string is not in the registry
class UnrecognizedUnitError : public std::runtime_error {
public:
    explicit UnrecognizedUnitError(const std::string& what) : std::runtime_error(what) {}
};

class Quantity {
public:
    /// @brief Empty dimensionless scalar (value 0)
    Quantity();

    /// @brief Scalar quantity
    /// @throws UnrecognizedUnitError if the unit is unknown
    Quantity(double value, const std::string& units);

    /// @brief 1-D array quantity
    Quantity(std::vector<double> values, const std::string& units);

    /// @brief 2-D array quantity stored row-major
    /// @param values Flattened values (size must be a multiple of columns)
    /// @param units Unit string
    /// @param columns Number of columns per row
    Quantity(std::vector<double> values, const std::string& units, std::size_t columns);

    /// @brief 2-D array quantity from nested rows
    static Quantity fromRows(const std::vector<std::vector<double>>& rows, const std::string& units);

    bool isArray() const { return isArray_; }
    bool is2D() const { return columns_ > 0; }
    bool empty() const { return values_.empty(); }
    std::size_t size() const { return values_.size(); }
    std::size_t rows() const;
    std::size_t columns() const { return columns_; }

    /// @brief Scalar value in the declared units
    /// @throws UnitMismatchError if the quantity is an array
    double value() const;

    /// @brief All values in the declared units (row-major for 2-D)
    const std::vector<double>& values() const { return values_; }

    /// @brief Element (row, column) of a 2-D array in declared units
    double at(std::size_t row, std::size_t column) const;

    /// @brief One row of a 2-D array in declared units
    std::vector<double> row(std::size_t index) const;

    const std::string& units() const { return units_; }
    const Dimension& dimension() const { return unit_->dimension; }
    const char* category() const { return unit_->category; }

    /// @brief Scalar value in SI units
    double valueSI() const;

    /// @brief All values in SI units
    std::vector<double> valuesSI() const;

    /// @brief Scalar value in the given units (same dimension required)
    double valueIn(const std::string& units) const;

    /// @brief Copy expressed in other units of the same dimension
    Quantity convertTo(const std::string& units) const;

    /// @brief Check the dimension, e.g. against Dimensions::kMolarEnergy
    bool hasDimension(const Dimension& dimension) const { return unit_->dimension == dimension; }

    /// @brief Throw UnitMismatchError unless the dimension matches
    /// @param dimension Expected dimension
    /// @param field Field name for the error message
    void requireDimension(const Dimension& dimension, const std::string& field) const;

    // Arithmetic: identical units required for sums, plain numbers scale
    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;
    Quantity operator*(double factor) const;
    Quantity operator/(double divisor) const;
    Quantity operator-() const;

    /// @brief Exact comparison of values, units and shape
    bool operator==(const Quantity& other) const;
    bool operator!=(const Quantity& other) const { return !(*this == other); }

private:
    std::vector<double> values_;
    std::string units_;
    const Unit* unit_;
    bool isArray_ = false;
    std::size_t columns_ = 0;   ///< 0 for scalars and 1-D arrays

    void resolveUnit();
    void requireSameUnits(const Quantity& other, const char* operation) const;
};

inline Quantity operator*(double factor, const Quantity& quantity) {
    return quantity * factor;
}

} // namespace Statmech
