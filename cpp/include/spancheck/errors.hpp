/**
 * @file errors.hpp
 * @brief Structured error handling for spancheck.
 *
 * This file defines error codes, the structured error descriptor carried
 * by a failed assessment, and the exception types thrown by the individual
 * assessment components. The assessment engine converts every exception
 * into an ErrorInfo so nothing propagates past its boundary.
 */

#ifndef SPANCHECK_ERRORS_HPP
#define SPANCHECK_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace spancheck {

/**
 * @brief Error codes for assessment failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error - assessment completed successfully
    OK = 0,

    // === Input Validation Errors (100-199) ===

    /// Required field is missing
    MISSING_FIELD = 100,

    /// Field is present but not a number or not a recognised option
    MALFORMED_FIELD = 101,

    /// Field is numeric but outside its permitted range
    OUT_OF_RANGE = 102,

    /// Combination of fields is not supported (e.g. continuous spans)
    UNSUPPORTED_CONFIGURATION = 103,

    // === Material Errors (200-299) ===

    /// Material kind or grade not present in the catalog
    UNKNOWN_MATERIAL = 200,

    /// Material kind has no capacity method for the given section
    UNSUPPORTED_MATERIAL = 201,

    // === Geometry Errors (300-399) ===

    /// Section dimension missing, zero, negative or inconsistent
    INVALID_GEOMETRY = 300,

    // === Loading Errors (400-499) ===

    /// Highway loading parameters are inconsistent
    INVALID_LOADING_PARAMETERS = 400,

    /// Vehicle axle set does not fit on the span
    INVALID_VEHICLE_SPACING = 401,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::MISSING_FIELD: return "MISSING_FIELD";
        case ErrorCode::MALFORMED_FIELD: return "MALFORMED_FIELD";
        case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorCode::UNSUPPORTED_CONFIGURATION: return "UNSUPPORTED_CONFIGURATION";
        case ErrorCode::UNKNOWN_MATERIAL: return "UNKNOWN_MATERIAL";
        case ErrorCode::UNSUPPORTED_MATERIAL: return "UNSUPPORTED_MATERIAL";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::INVALID_LOADING_PARAMETERS: return "INVALID_LOADING_PARAMETERS";
        case ErrorCode::INVALID_VEHICLE_SPACING: return "INVALID_VEHICLE_SPACING";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for a failed assessment.
 *
 * Contains machine-readable error code, human-readable message,
 * the offending input field and diagnostic details.
 */
struct ErrorInfo {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message (self-contained, names the field)
    std::string message;

    /// Input field that caused the error (empty if not field-specific)
    std::string field;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    ErrorInfo()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code, message and optional field.
     */
    ErrorInfo(ErrorCode code, const std::string& message, const std::string& field = "")
        : code(code), message(message), field(field) {}

    /**
     * @brief Check if this represents a successful state.
     */
    bool is_ok() const { return code == ErrorCode::OK; }

    /**
     * @brief Check if this represents an error state.
     */
    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!field.empty()) {
            result += "\n  Field: " + field;
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a required field that was not supplied.
     */
    static ErrorInfo missing_field(const std::string& field) {
        ErrorInfo err(ErrorCode::MISSING_FIELD,
            "Required field '" + field + "' is missing", field);
        err.suggestion = "Supply a value for '" + field + "'.";
        return err;
    }

    /**
     * @brief Create error for a field whose text cannot be interpreted.
     */
    static ErrorInfo malformed_field(const std::string& field, const std::string& value,
                                     const std::string& expected) {
        ErrorInfo err(ErrorCode::MALFORMED_FIELD,
            "Field '" + field + "' has invalid value '" + value + "'", field);
        err.details["expected"] = expected;
        return err;
    }

    /**
     * @brief Create error for a numeric field outside its permitted range.
     */
    static ErrorInfo out_of_range(const std::string& field, double value,
                                  const std::string& constraint) {
        ErrorInfo err(ErrorCode::OUT_OF_RANGE,
            "Field '" + field + "' = " + std::to_string(value) + " must be " + constraint,
            field);
        err.details["constraint"] = constraint;
        return err;
    }
};

/**
 * @brief Base exception for all assessment component failures.
 *
 * Carries the structured ErrorInfo so the engine can report it verbatim.
 */
class AssessmentError : public std::runtime_error {
public:
    explicit AssessmentError(ErrorInfo info)
        : std::runtime_error(info.message), info_(std::move(info)) {}

    const ErrorInfo& info() const { return info_; }
    ErrorCode code() const { return info_.code; }

private:
    ErrorInfo info_;
};

/// Missing or out-of-range input field
class ValidationError : public AssessmentError {
public:
    explicit ValidationError(ErrorInfo info) : AssessmentError(std::move(info)) {}
};

/// Material kind or grade not in the catalog
class UnknownMaterialError : public AssessmentError {
public:
    UnknownMaterialError(const std::string& message, const std::string& field)
        : AssessmentError(ErrorInfo(ErrorCode::UNKNOWN_MATERIAL, message, field)) {}
};

/// Section dimension missing, zero or negative
class InvalidGeometryError : public AssessmentError {
public:
    InvalidGeometryError(const std::string& message, const std::string& field)
        : AssessmentError(ErrorInfo(ErrorCode::INVALID_GEOMETRY, message, field)) {}
};

/// Highway loading parameters inconsistent (e.g. loaded width below lane width)
class InvalidLoadingParametersError : public AssessmentError {
public:
    InvalidLoadingParametersError(const std::string& message, const std::string& field)
        : AssessmentError(ErrorInfo(ErrorCode::INVALID_LOADING_PARAMETERS, message, field)) {}
};

/// Axle set cannot fit on the span
class InvalidVehicleSpacingError : public AssessmentError {
public:
    InvalidVehicleSpacingError(const std::string& message, const std::string& field)
        : AssessmentError(ErrorInfo(ErrorCode::INVALID_VEHICLE_SPACING, message, field)) {}
};

/// No capacity method for the material/section combination
class UnsupportedMaterialError : public AssessmentError {
public:
    UnsupportedMaterialError(const std::string& message, const std::string& field)
        : AssessmentError(ErrorInfo(ErrorCode::UNSUPPORTED_MATERIAL, message, field)) {}
};

}  // namespace spancheck

#endif  // SPANCHECK_ERRORS_HPP
