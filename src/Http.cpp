// src/Http.cpp
#include <Courier/Http.hpp>
#include <Courier/Utils/Logger.hpp>

#include <stdexcept>

namespace Courier {
namespace Http {

CprTransport::CprTransport(const Config& config) : m_userAgent(config.userAgent) {
    m_logger = Utils::Logger::GetOrCreateLogger("Transport");

    if (config.caBundle) {
        m_logger->info("Configuring SslOptions with CA bundle: {}", config.caBundle->string());
        m_sslOptions = cpr::Ssl(
            cpr::ssl::CaInfo{config.caBundle->string()},
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    } else {
        m_logger->debug("No CA bundle configured, using system CAs.");
    }
}

cpr::Session CprTransport::CreateSession(const std::string& url, const Headers& headers) const {
    cpr::Session session;
    session.SetSslOptions(m_sslOptions);
    session.SetUserAgent(cpr::UserAgent{m_userAgent});
    session.SetUrl(cpr::Url{url});

    cpr::Header header;
    for (const auto& [name, value] : headers) {
        header[name] = value;
    }
    session.SetHeader(header);
    return session;
}

TransportResponse CprTransport::Finish(const cpr::Response& response, const char* verb, const std::string& url) const {
    TransportResponse result;
    if (response.error.code != cpr::ErrorCode::OK) {
        m_logger->error("{} {} failed. Error: \"{}\", CPR Error Code: {}",
            verb, url, response.error.message, static_cast<int>(response.error.code));
        result.transportFailed = true;
        result.errorMessage = response.error.message;
        return result;
    }

    result.status = response.status_code;
    result.body = response.text;
    m_logger->trace("{} {} -> {} ({} bytes)", verb, url, response.status_code, response.text.size());
    return result;
}

TransportResponse CprTransport::Get(const std::string& url, const Headers& headers) {
    m_logger->trace("GET: {}", url);
    cpr::Session session = CreateSession(url, headers);
    return Finish(session.Get(), "GET", url);
}

TransportResponse CprTransport::Send(HttpMethod method, const std::string& url,
                                     const std::optional<std::string>& body, const Headers& headers) {
    const std::string verb = toString(method);
    m_logger->trace("{}: {}", verb, url);
    cpr::Session session = CreateSession(url, headers);
    if (body) {
        session.SetBody(cpr::Body{*body});
    }

    switch (method) {
        case HttpMethod::Get:    return Finish(session.Get(), "GET", url);
        case HttpMethod::Post:   return Finish(session.Post(), "POST", url);
        case HttpMethod::Put:    return Finish(session.Put(), "PUT", url);
        case HttpMethod::Delete: return Finish(session.Delete(), "DELETE", url);
    }
    throw std::invalid_argument("Unsupported method for " + url);
}

TransportResponse CprTransport::Upload(const std::string& url, const std::string& body,
                                       const Headers& headers, const UploadTick& onTick) {
    m_logger->info("UPLOAD: {} ({} bytes)", url, body.size());
    cpr::Session session = CreateSession(url, headers);
    session.SetBody(cpr::Body{body});

    if (onTick) {
        session.SetProgressCallback(cpr::ProgressCallback{
            [&onTick](cpr::cpr_pf_arg_t /*downloadTotal*/, cpr::cpr_pf_arg_t /*downloadNow*/,
                      cpr::cpr_pf_arg_t uploadTotal, cpr::cpr_pf_arg_t uploadNow, intptr_t /*userdata*/) -> bool {
                // libcurl ticks before it knows the upload size; those carry no information
                if (uploadTotal > 0) {
                    onTick(static_cast<std::uint64_t>(uploadNow), static_cast<std::uint64_t>(uploadTotal));
                }
                return true;
            }});
    }

    return Finish(session.Post(), "UPLOAD", url);
}

} // namespace Http
} // namespace Courier
