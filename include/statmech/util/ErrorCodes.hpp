#pragma once

namespace Statmech {
namespace ErrorCode {

// Success
constexpr int kSuccess = 0;

// Input validation errors (1-9)
constexpr int kInvalidModeParameter = 1;
constexpr int kUnsupportedMode = 2;
constexpr int kInvalidConformer = 3;
constexpr int kInvalidTemperature = 4;
constexpr int kInvalidEnergyTransfer = 5;
constexpr int kNoConformer = 6;

// Unit errors (10-19)
constexpr int kUnitMismatch = 10;
constexpr int kUnrecognizedUnit = 11;

// Record errors (20-29)
constexpr int kRecordNotFound = 20;
constexpr int kMissingRequiredField = 21;
constexpr int kInvalidRecordFormat = 22;
constexpr int kRecordWriteError = 23;

// Thermo evaluation errors (30-39)
constexpr int kNonPhysicalResult = 30;

// Fit errors (40-49)
constexpr int kPoorFitQuality = 40;
constexpr int kFitDidNotConverge = 41;
constexpr int kInvalidFitConfiguration = 42;
constexpr int kSingularFitSystem = 43;
constexpr int kNoThermoModel = 44;

// Batch errors (90-99)
constexpr int kUnexpectedError = 90;

// Get error message string
inline const char* getMessage(int code) {
    switch (code) {
        case kSuccess: return "Success";
        case kInvalidModeParameter: return "Invalid mode parameter";
        case kUnsupportedMode: return "Unsupported mode";
        case kInvalidConformer: return "Invalid conformer";
        case kInvalidTemperature: return "Invalid temperature";
        case kInvalidEnergyTransfer: return "Invalid energy transfer model";
        case kNoConformer: return "No conformer in species record";
        case kUnitMismatch: return "Unit mismatch";
        case kUnrecognizedUnit: return "Unrecognized unit";
        case kRecordNotFound: return "Species record not found";
        case kMissingRequiredField: return "Missing required field";
        case kInvalidRecordFormat: return "Invalid record format";
        case kRecordWriteError: return "Species record write error";
        case kNonPhysicalResult: return "Non-physical thermodynamic result";
        case kPoorFitQuality: return "Poor NASA fit quality";
        case kFitDidNotConverge: return "NASA fit did not converge";
        case kInvalidFitConfiguration: return "Invalid fit configuration";
        case kSingularFitSystem: return "Singular fit system";
        case kNoThermoModel: return "No thermodynamic model available";
        case kUnexpectedError: return "Unexpected error while processing species";
        default: return "Unknown error";
    }
}

} // namespace ErrorCode
} // namespace Statmech
