/**
 * @file types.hpp
 * @brief Core type definitions for Marginalia
 *
 * Error codes shared by the identifier codec, the selector escaper,
 * the configuration layer and the command-line tool.
 */

#pragma once

namespace marginalia {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // General errors
    Unknown,
    InvalidArgument,

    // Identifier errors
    InvalidInput,       // Argument has the wrong fundamental type
    InvalidIdentifier,  // Text that is not a recognized identifier shape

    // Configuration errors
    FileNotFound,
    ParseError,
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidInput: return "Invalid input";
        case ErrorCode::InvalidIdentifier: return "Invalid identifier";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::ParseError: return "Parse error";
        default: return "Unknown error code";
    }
}

} // namespace marginalia
