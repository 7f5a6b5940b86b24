#pragma once

namespace Statmech {
namespace Constants {

// Physical constants (CODATA 2006, SI), the set species records are generated with
constexpr double kIdealGasConstant = 8.314472;      // J/(mol·K)
constexpr double kBoltzmann = 1.3806504e-23;        // J/K
constexpr double kAvogadro = 6.02214179e23;         // 1/mol
constexpr double kPlanck = 6.62606896e-34;          // J·s
constexpr double kSpeedOfLight = 299792458.0;       // m/s
constexpr double kAtomicMassUnit = 1.660538782e-27; // kg
constexpr double kElectronVolt = 1.602176487e-19;   // J
constexpr double kBohrRadius = 0.52917720859e-10;   // m
constexpr double kPi = 3.14159265358979323846;

// Reference state
constexpr double kReferencePressure = 1.0e5;        // Pa (1 bar)
constexpr double kStandardTemperature = 298.15;     // K
constexpr double kCalorie = 4.184;                  // J

// NASA polynomial layout
constexpr int kNumNASACoeff = 7;
constexpr int kNumNASAFitCoeff = 5;                 // a1..a5 fitted against Cp

// Default run settings
constexpr double kDefaultTmin = 10.0;               // K
constexpr double kDefaultTmax = 3000.0;             // K
constexpr double kDefaultTmid = 1000.0;             // K
constexpr int kDefaultSamplePoints = 100;           // per polynomial range
constexpr int kDefaultTmidCandidates = 20;
constexpr int kDefaultMaxFitIterations = 50;
constexpr int kDefaultTorsionBasis = 100;           // m = -100..100
constexpr int kTorsionPotentialGrid = 3600;         // phi grid for barrier search

// System limits
constexpr int kNumElementsPT = 118;

// Mode variants, in the order of the Mode variant alternatives
enum class ModeType {
    Translation = 0,
    NonlinearRotor,
    LinearRotor,
    HarmonicOscillator,
    HinderedRotor
};

// Mode class names used by the species record
constexpr const char* kModeTypeNames[] = {
    "IdealGasTranslation",
    "NonlinearRotor",
    "LinearRotor",
    "HarmonicOscillator",
    "HinderedRotor"
};

// Temperatures of the rendered Cp table [K]
constexpr double kThermoTableTemperatures[] = {
    300.0, 400.0, 500.0, 600.0, 800.0, 1000.0, 1500.0, 2000.0, 2400.0
};

constexpr int kNumThermoTableTemperatures = 9;

} // namespace Constants
} // namespace Statmech
