// include/Courier/ApiError.hpp
#ifndef COURIER_API_ERROR_HPP
#define COURIER_API_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace Courier {

    // Every failure surfaced by HttpManager::Handle and the model helpers
    class ApiError : public std::runtime_error {
    public:
        enum class Kind {
            NetworkUnavailable,
            InvalidResponse,
            ServerError,
            DecodingError,
            TransportError
        };

        static constexpr long kDefaultServerErrorCode = 500;

        static ApiError networkUnavailable();
        static ApiError invalidResponse(long statusCode);
        // A status code of 0 (no distinguishable code) becomes 500
        static ApiError serverError(long statusCode);
        static ApiError decodingError(const std::string& message);
        static ApiError transportError(const std::string& message);

        Kind kind() const { return m_kind; }

        // HTTP status when the server answered; empty for errors raised before or below HTTP
        std::optional<long> statusCode() const { return m_statusCode; }

        // Message suitable for showing to an end user
        std::string userMessage() const;

    private:
        ApiError(Kind kind, const std::string& detail, std::optional<long> statusCode);

        Kind m_kind;
        std::optional<long> m_statusCode;
    };

    const char* toString(ApiError::Kind kind);

} // namespace Courier

#endif // COURIER_API_ERROR_HPP
