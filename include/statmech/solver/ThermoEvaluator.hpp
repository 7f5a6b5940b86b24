/// @file ThermoEvaluator.hpp
/// @brief Heat capacity, enthalpy and entropy from the partition function
/// @details With d1 = dlnQ/dT and d2 = d²lnQ/dT²:
///   Cp = R (T² d2 + 2 T d1)
///   H  = E0 + R T² d1
///   S  = R (ln Q + T d1)

#pragma once

#include "statmech/solver/PartitionFunctionEvaluator.hpp"
#include "statmech/util/Tolerances.hpp"
#include <functional>
#include <string>
#include <vector>

namespace Statmech {

/// @brief Thermo functions of one temperature, SI units
struct ThermoPoint {
    double dTemperature = 0.0;   ///< [K]
    double dHeatCapacity = 0.0;  ///< [J/(mol·K)]
    double dEnthalpy = 0.0;      ///< [J/mol]
    double dEntropy = 0.0;       ///< [J/(mol·K)]
    double dGibbsEnergy = 0.0;   ///< [J/mol]
};

/// @brief Continuous Cp(T), H(T), S(T) handed to the NASA fitter
struct ThermoFunctions {
    std::function<double(double)> heatCapacity;  ///< [J/(mol·K)]
    std::function<double(double)> enthalpy;      ///< [J/mol]
    std::function<double(double)> entropy;       ///< [J/(mol·K)]

    bool isValid() const { return heatCapacity && enthalpy && entropy; }
};

class ThermoEvaluator {
public:
    explicit ThermoEvaluator(const Tolerances& tolerances = Tolerances());

    /// @brief Prepare the partition function of a conformer
    /// @return Error code (see PartitionFunctionEvaluator::prepare)
    int prepare(const Conformer& conformer, const PartitionSettings& settings,
                std::string& detail);

    /// @brief Thermo functions at one temperature
    /// @param T Temperature [K]
    /// @param point Output values
    /// @return Error code (0 = success, kInvalidTemperature, kNonPhysicalResult)
    int evaluate(double T, ThermoPoint& point) const;

    /// @brief Evaluate a temperature grid
    /// @param temperatures Grid [K]
    /// @param points Output, one point per temperature in grid order
    /// @return Error code; kNonPhysicalResult names the first offending
    ///         temperature in the detail string
    int sample(const std::vector<double>& temperatures, std::vector<ThermoPoint>& points,
               std::string& detail) const;

    /// @brief Convenience getters
    /// @return Pair of (value, error code)
    std::pair<double, int> getHeatCapacity(double T) const;
    std::pair<double, int> getEnthalpy(double T) const;
    std::pair<double, int> getEntropy(double T) const;

    double getE0() const { return dE0_; }
    double getCp0() const { return partition_.getCp0(); }
    double getCpInf() const { return partition_.getCpInf(); }

    /// @brief Bind Cp/H/S as continuous functions for fitting
    /// @details The evaluator must outlive the returned functions
    ThermoFunctions functions() const;

    const PartitionFunctionEvaluator& getPartitionEvaluator() const { return partition_; }

    bool isPrepared() const { return partition_.isPrepared(); }

private:
    PartitionFunctionEvaluator partition_;
    Tolerances tolerances_;
    double dE0_ = 0.0;   ///< [J/mol]
};

} // namespace Statmech
