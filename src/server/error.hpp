#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    BadRequest,
    MissingPart,
    EmptySelection,
    FetchError,
    DecodeError,
    NotFound,
    TooLarge,
    UnsupportedExtension,
    UnsupportedContentType,
    PathTraversal,
    ExternalTool,
    Timeout,
    Inference,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Client input problems map to 400, everything else is a server-side failure.
constexpr bool is_client_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ExternalTool:
        case ErrorKind::Timeout:
        case ErrorKind::Inference:
            return false;
        default:
            return true;
    }
}

constexpr int http_status(ErrorKind kind) {
    return is_client_error(kind) ? 400 : 500;
}

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return "bad_request";
        case ErrorKind::MissingPart: return "missing_part";
        case ErrorKind::EmptySelection: return "empty_selection";
        case ErrorKind::FetchError: return "fetch_error";
        case ErrorKind::DecodeError: return "decode_error";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::TooLarge: return "too_large";
        case ErrorKind::UnsupportedExtension: return "unsupported_extension";
        case ErrorKind::UnsupportedContentType: return "unsupported_content_type";
        case ErrorKind::PathTraversal: return "path_traversal";
        case ErrorKind::ExternalTool: return "external_tool";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Inference: return "inference";
    }
    return "unknown";
}
