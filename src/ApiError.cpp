// src/ApiError.cpp
#include <Courier/ApiError.hpp>

namespace Courier {

ApiError::ApiError(Kind kind, const std::string& detail, std::optional<long> statusCode)
    : std::runtime_error(detail), m_kind(kind), m_statusCode(statusCode) {}

ApiError ApiError::networkUnavailable() {
    return ApiError(Kind::NetworkUnavailable, "network unavailable", std::nullopt);
}

ApiError ApiError::invalidResponse(long statusCode) {
    return ApiError(Kind::InvalidResponse, "invalid response (status " + std::to_string(statusCode) + ")", statusCode);
}

ApiError ApiError::serverError(long statusCode) {
    const long code = statusCode > 0 ? statusCode : kDefaultServerErrorCode;
    return ApiError(Kind::ServerError, "server error " + std::to_string(code), code);
}

ApiError ApiError::decodingError(const std::string& message) {
    return ApiError(Kind::DecodingError, message, std::nullopt);
}

ApiError ApiError::transportError(const std::string& message) {
    return ApiError(Kind::TransportError, message, std::nullopt);
}

std::string ApiError::userMessage() const {
    switch (m_kind) {
        case Kind::NetworkUnavailable:
            return "The Internet connection appears to be offline. Please check your connection and try again.";
        case Kind::InvalidResponse:
            return "Invalid response from the server. Please try again later.";
        case Kind::ServerError:
            return "Server error (" + std::to_string(m_statusCode.value_or(kDefaultServerErrorCode)) + "). Please try again later.";
        case Kind::DecodingError:
            return std::string("Failed to process the response: ") + what() + ".";
        case Kind::TransportError:
            return std::string("Network error occurred: ") + what() + ". Please check your connection.";
    }
    return what();
}

const char* toString(ApiError::Kind kind) {
    switch (kind) {
        case ApiError::Kind::NetworkUnavailable: return "NetworkUnavailable";
        case ApiError::Kind::InvalidResponse:    return "InvalidResponse";
        case ApiError::Kind::ServerError:        return "ServerError";
        case ApiError::Kind::DecodingError:      return "DecodingError";
        case ApiError::Kind::TransportError:     return "TransportError";
    }
    return "Unknown";
}

} // namespace Courier
