#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    InvalidConfig,
    InvalidRequest,
    UnsupportedFormat,
    AudioTooLarge,
    FetchFailed,
    InferenceFailed,
    ContextLost,
    Timeout,
    StoreFailed,
    NotFound,
};

struct Error {
    ErrorCode code;
    std::string message;
};

// Transient errors may succeed on resubmission; permanent ones never will.
inline bool is_transient(ErrorCode code) {
    switch (code) {
        case ErrorCode::FetchFailed:
        case ErrorCode::InferenceFailed:
        case ErrorCode::ContextLost:
        case ErrorCode::Timeout:
        case ErrorCode::StoreFailed:
            return true;
        default:
            return false;
    }
}

inline std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "invalid_config";
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::UnsupportedFormat: return "unsupported_format";
        case ErrorCode::AudioTooLarge: return "audio_too_large";
        case ErrorCode::FetchFailed: return "fetch_failed";
        case ErrorCode::InferenceFailed: return "inference_failed";
        case ErrorCode::ContextLost: return "context_lost";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::StoreFailed: return "store_failed";
        case ErrorCode::NotFound: return "not_found";
    }
    return "unknown";
}
