// include/Courier/Http.hpp
#ifndef COURIER_HTTP_HPP
#define COURIER_HTTP_HPP

#include <Courier/Config.hpp>
#include <Courier/Types/Request.hpp>
#include <cpr/cpr.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Courier {
    namespace Http {

        // What came back from one exchange. `transportFailed` means no HTTP status was
        // received at all (DNS, TLS, connection reset...) and `errorMessage` says why.
        struct TransportResponse {
            long status = 0;
            std::string body;
            bool transportFailed = false;
            std::string errorMessage;
        };

        // Called with cumulative bytes sent and the total body size, on every transport tick
        using UploadTick = std::function<void(std::uint64_t bytesSent, std::uint64_t bytesTotal)>;

        // Executes one HTTP exchange. Calls block the calling thread until the
        // response arrives or the exchange fails, and never throw for HTTP statuses.
        class Transport {
        public:
            virtual ~Transport() = default;

            virtual TransportResponse Get(const std::string& url, const Headers& headers) = 0;
            virtual TransportResponse Send(HttpMethod method, const std::string& url,
                                           const std::optional<std::string>& body, const Headers& headers) = 0;
            virtual TransportResponse Upload(const std::string& url, const std::string& body,
                                             const Headers& headers, const UploadTick& onTick) = 0;
        };

        // cpr-backed transport; a fresh session per exchange keeps concurrent callers independent
        class CprTransport : public Transport {
        public:
            explicit CprTransport(const Config& config);

            TransportResponse Get(const std::string& url, const Headers& headers) override;
            TransportResponse Send(HttpMethod method, const std::string& url,
                                   const std::optional<std::string>& body, const Headers& headers) override;
            TransportResponse Upload(const std::string& url, const std::string& body,
                                     const Headers& headers, const UploadTick& onTick) override;

        private:
            std::string m_userAgent;
            cpr::SslOptions m_sslOptions;
            std::shared_ptr<spdlog::logger> m_logger;

            cpr::Session CreateSession(const std::string& url, const Headers& headers) const;
            TransportResponse Finish(const cpr::Response& response, const char* verb, const std::string& url) const;
        };

    } // namespace Http
} // namespace Courier

#endif // COURIER_HTTP_HPP
