/// @file Quantity.cpp
/// @brief Implementation of unit-tagged quantities

#include "statmech/util/Quantity.hpp"
#include <utility>

namespace Statmech {

Quantity::Quantity()
    : values_{0.0}, units_(""), unit_(nullptr) {
    resolveUnit();
}

Quantity::Quantity(double value, const std::string& units)
    : values_{value}, units_(units), unit_(nullptr) {
    resolveUnit();
}

Quantity::Quantity(std::vector<double> values, const std::string& units)
    : values_(std::move(values)), units_(units), unit_(nullptr), isArray_(true) {
    resolveUnit();
}

Quantity::Quantity(std::vector<double> values, const std::string& units, std::size_t columns)
    : values_(std::move(values)), units_(units), unit_(nullptr), isArray_(true), columns_(columns) {
    if (columns_ == 0 || values_.size() % columns_ != 0) {
        throw std::invalid_argument("Quantity: " + std::to_string(values_.size()) +
                                    " values do not fill rows of " + std::to_string(columns_));
    }
    resolveUnit();
}

Quantity Quantity::fromRows(const std::vector<std::vector<double>>& rows, const std::string& units) {
    if (rows.empty()) {
        return Quantity(std::vector<double>{}, units);
    }
    std::size_t columns = rows.front().size();
    std::vector<double> flat;
    flat.reserve(rows.size() * columns);
    for (const auto& r : rows) {
        if (r.size() != columns) {
            throw std::invalid_argument("Quantity: ragged rows in 2-D array");
        }
        flat.insert(flat.end(), r.begin(), r.end());
    }
    return Quantity(std::move(flat), units, columns);
}

void Quantity::resolveUnit() {
    unit_ = findUnit(units_);
    if (unit_ == nullptr) {
        throw UnrecognizedUnitError("Unrecognized unit '" + units_ + "'");
    }
}

std::size_t Quantity::rows() const {
    if (columns_ == 0) {
        return isArray_ ? values_.size() : 1;
    }
    return values_.size() / columns_;
}

double Quantity::value() const {
    if (isArray_) {
        throw UnitMismatchError("Scalar value requested from array quantity [" + units_ + "]");
    }
    return values_.front();
}

double Quantity::at(std::size_t row, std::size_t column) const {
    std::size_t stride = (columns_ == 0) ? 1 : columns_;
    return values_.at(row * stride + column);
}

std::vector<double> Quantity::row(std::size_t index) const {
    if (columns_ == 0) {
        return {values_.at(index)};
    }
    auto first = values_.begin() + static_cast<std::ptrdiff_t>(index * columns_);
    return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(columns_));
}

double Quantity::valueSI() const {
    return value() * unit_->factorToSI;
}

std::vector<double> Quantity::valuesSI() const {
    std::vector<double> result(values_);
    for (auto& v : result) {
        v *= unit_->factorToSI;
    }
    return result;
}

double Quantity::valueIn(const std::string& units) const {
    const Unit* target = findUnit(units);
    if (target == nullptr) {
        throw UnrecognizedUnitError("Unrecognized unit '" + units + "'");
    }
    if (target->dimension != unit_->dimension) {
        throw UnitMismatchError("Cannot express " + std::string(unit_->category) + " [" + units_ +
                                "] in " + target->category + " [" + units + "]");
    }
    return valueSI() / target->factorToSI;
}

Quantity Quantity::convertTo(const std::string& units) const {
    const Unit* target = findUnit(units);
    if (target == nullptr) {
        throw UnrecognizedUnitError("Unrecognized unit '" + units + "'");
    }
    if (target->dimension != unit_->dimension) {
        throw UnitMismatchError("Cannot convert " + std::string(unit_->category) + " [" + units_ +
                                "] to " + target->category + " [" + units + "]");
    }
    Quantity result(*this);
    double factor = unit_->factorToSI / target->factorToSI;
    for (auto& v : result.values_) {
        v *= factor;
    }
    result.units_ = units;
    result.unit_ = target;
    return result;
}

void Quantity::requireDimension(const Dimension& dimension, const std::string& field) const {
    if (unit_->dimension != dimension) {
        throw UnitMismatchError(field + ": expected dimension " + dimension.toString() +
                                ", got [" + units_ + "] (" + unit_->dimension.toString() + ")");
    }
}

void Quantity::requireSameUnits(const Quantity& other, const char* operation) const {
    if (unit_->dimension != other.unit_->dimension) {
        throw UnitMismatchError(std::string(operation) + " of incompatible dimensions [" +
                                units_ + "] and [" + other.units_ + "]");
    }
    if (units_ != other.units_) {
        throw UnitMismatchError(std::string(operation) + " of [" + units_ + "] and [" +
                                other.units_ + "] requires an explicit conversion");
    }
    if (isArray_ != other.isArray_ || values_.size() != other.values_.size() ||
        columns_ != other.columns_) {
        throw UnitMismatchError(std::string(operation) + " of quantities with different shapes");
    }
}

Quantity Quantity::operator+(const Quantity& other) const {
    requireSameUnits(other, "Addition");
    Quantity result(*this);
    for (std::size_t i = 0; i < values_.size(); ++i) {
        result.values_[i] += other.values_[i];
    }
    return result;
}

Quantity Quantity::operator-(const Quantity& other) const {
    requireSameUnits(other, "Subtraction");
    Quantity result(*this);
    for (std::size_t i = 0; i < values_.size(); ++i) {
        result.values_[i] -= other.values_[i];
    }
    return result;
}

Quantity Quantity::operator*(double factor) const {
    Quantity result(*this);
    for (auto& v : result.values_) {
        v *= factor;
    }
    return result;
}

Quantity Quantity::operator/(double divisor) const {
    Quantity result(*this);
    for (auto& v : result.values_) {
        v /= divisor;
    }
    return result;
}

Quantity Quantity::operator-() const {
    return *this * -1.0;
}

bool Quantity::operator==(const Quantity& other) const {
    return units_ == other.units_ && isArray_ == other.isArray_ &&
           columns_ == other.columns_ && values_ == other.values_;
}

} // namespace Statmech
