#pragma once

#include <string>

enum class ErrorKind { InvalidRequest, NotFound, PayloadTooLarge, ServiceUnavailable, Internal };

// Error reported to API clients. http_status always matches kind.
struct ApiError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    int http_status = 500;

    static ApiError invalid_request(std::string message) {
        return {ErrorKind::InvalidRequest, std::move(message), 400};
    }
    static ApiError not_found(std::string message = "Not found") {
        return {ErrorKind::NotFound, std::move(message), 404};
    }
    static ApiError payload_too_large(std::string message) {
        return {ErrorKind::PayloadTooLarge, std::move(message), 413};
    }
    static ApiError service_unavailable(std::string message) {
        return {ErrorKind::ServiceUnavailable, std::move(message), 503};
    }
    static ApiError internal(std::string message) {
        return {ErrorKind::Internal, std::move(message), 500};
    }
};
