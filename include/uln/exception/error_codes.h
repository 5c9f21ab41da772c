/**
 * @file error_codes.h
 * @brief Standardized error codes for ULN validation
 *
 * Every failure raised by the library maps to exactly one of these codes.
 * NULL_INPUT and INVALID_FORMAT are caller contract violations,
 * INVALID_VALUE is an expected data-quality outcome (e.g. a mistyped ULN).
 */

#pragma once

#include <optional>
#include <string>

namespace uln {
namespace exception {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    NULL_INPUT = 1001,
    INVALID_FORMAT = 1002,
    INVALID_VALUE = 1003,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NULL_INPUT: return "NULL_INPUT";
        case ErrorCode::INVALID_FORMAT: return "INVALID_FORMAT";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Parse error code from its string form
 * @return ErrorCode, or std::nullopt for an unknown name
 */
inline std::optional<ErrorCode> errorCodeFromString(const std::string& name) {
    if (name == "NULL_INPUT") return ErrorCode::NULL_INPUT;
    if (name == "INVALID_FORMAT") return ErrorCode::INVALID_FORMAT;
    if (name == "INVALID_VALUE") return ErrorCode::INVALID_VALUE;
    return std::nullopt;
}

/**
 * @brief Convert error code to process exit status (uln-check)
 */
inline int errorCodeToExitStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_VALUE: return 1;   // Rejected ULN
        case ErrorCode::INVALID_FORMAT: return 2;  // Malformed input
        case ErrorCode::NULL_INPUT: return 64;     // Usage error (EX_USAGE)
        default: return 70;                        // EX_SOFTWARE
    }
}

} // namespace exception
} // namespace uln
