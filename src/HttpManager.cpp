// src/HttpManager.cpp
#include <Courier/HttpManager.hpp>
#include <Courier/ApiError.hpp>
#include <Courier/Fingerprint.hpp>
#include <Courier/Multipart.hpp>
#include <Courier/Utils/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <stdexcept>

namespace Courier {

namespace {
    constexpr long kHttpOk = 200;

    bool iequals(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    // Adds `name: value` unless the caller already set that header (in any letter case)
    void setDefaultHeader(Headers& headers, const std::string& name, const std::string& value) {
        auto it = std::find_if(headers.begin(), headers.end(), [&](const auto& h) { return iequals(h.first, name); });
        if (it == headers.end()) {
            headers.emplace(name, value);
        }
    }

    // Turns transport ticks into a clamped, non-decreasing fraction
    class UploadProgress {
    public:
        explicit UploadProgress(const HttpManager::ProgressCallback& callback) : m_callback(callback) {}

        void tick(std::uint64_t sent, std::uint64_t total) {
            if (total == 0) {
                return;
            }
            double fraction = std::clamp(static_cast<double>(sent) / static_cast<double>(total), 0.0, 1.0);
            report(fraction);
        }

        void complete() {
            report(1.0);
        }

    private:
        void report(double fraction) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (fraction <= m_last) {
                    return;
                }
                m_last = fraction;
            }
            if (m_callback) {
                m_callback(fraction);
            }
        }

        const HttpManager::ProgressCallback& m_callback;
        std::mutex m_mutex;
        double m_last = -1.0;
    };
}

HttpManager::HttpManager(const Config& config,
                         std::shared_ptr<Http::Transport> transport,
                         std::shared_ptr<ResponseCache> cache)
    : m_transport(std::move(transport)), m_cache(std::move(cache)), m_connected(config.assumeConnected) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");
    if (!m_transport || !m_cache) {
        throw std::invalid_argument("HttpManager requires a transport and a response cache");
    }
    m_logger->info("HttpManager initialized (initially {}).", m_connected ? "connected" : "disconnected");
}

HttpManager::~HttpManager() {
    DetachMonitor();
    m_logger->info("HttpManager shutting down with {} pending request(s).", m_pending.size());
}

std::string HttpManager::Handle(const Request& request, const ProgressCallback& progress) {
    return Execute(request, progress, true);
}

std::future<std::string> HttpManager::HandleAsync(Request request, ProgressCallback progress) {
    return std::async(std::launch::async,
                      [this, request = std::move(request), progress = std::move(progress)]() {
                          return Handle(request, progress);
                      });
}

std::string HttpManager::Execute(const Request& request, const ProgressCallback& progress, bool queueOnOfflineFailure) {
    const std::string key = fingerprint(request);

    if (!IsConnected()) {
        if (std::optional<std::string> cached = m_cache->get(key)) {
            m_logger->debug("Offline, serving cached response for {} ({} bytes)", describe(request), cached->size());
            return *cached;
        }
    }

    try {
        std::string bytes = Dispatch(request, progress);
        try {
            m_cache->put(key, bytes);
        } catch (const std::exception& e) {
            // The caller still gets the live response
            m_logger->warn("Could not cache response for {}: {}", key, e.what());
        }
        return bytes;
    } catch (const ApiError& e) {
        const bool connected = IsConnected();
        m_logger->debug("{} failed ({}): {}. Connected: {}", describe(request), toString(e.kind()), e.what(), connected);
        if (!connected && queueOnOfflineFailure) {
            m_pending.append(request);
        }
        throw;
    }
}

std::string HttpManager::Dispatch(const Request& request, const ProgressCallback& progress) {
    try {
        if (const auto* get = std::get_if<GetRequest>(&request)) {
            return FetchData(*get);
        }
        if (const auto* post = std::get_if<PostRequest>(&request)) {
            return SendData(HttpMethod::Post, post->url, post->body, post->headers);
        }
        if (const auto* rest = std::get_if<RestRequest>(&request)) {
            return SendData(rest->method, rest->url, rest->body, rest->headers);
        }
        return UploadMultipart(std::get<MultipartUpload>(request), progress);
    } catch (const ApiError&) {
        throw;
    } catch (const std::exception& e) {
        // Anything the transport layer throws is an I/O failure as far as callers are concerned
        throw ApiError::transportError(e.what());
    }
}

void HttpManager::RequireConnection(const std::string& url) const {
    if (!IsConnected()) {
        m_logger->debug("Fast-fail, no connectivity: {}", url);
        throw ApiError::networkUnavailable();
    }
}

std::string HttpManager::FetchData(const GetRequest& request) {
    RequireConnection(request.url);

    Headers headers = request.headers;
    setDefaultHeader(headers, "Cache-Control", "no-cache");

    Http::TransportResponse response = m_transport->Get(request.url, headers);
    if (response.transportFailed) {
        throw ApiError::transportError(response.errorMessage);
    }
    if (response.status != kHttpOk) {
        m_logger->warn("GET {} returned status {}", request.url, response.status);
        throw ApiError::invalidResponse(response.status);
    }
    return std::move(response.body);
}

std::string HttpManager::SendData(HttpMethod method, const std::string& url,
                                  const std::optional<std::string>& body, const Headers& callerHeaders) {
    RequireConnection(url);

    Headers headers = callerHeaders;
    setDefaultHeader(headers, "Content-Type", "application/json");

    Http::TransportResponse response = m_transport->Send(method, url, body, headers);
    if (response.transportFailed) {
        throw ApiError::transportError(response.errorMessage);
    }
    if (response.status != kHttpOk) {
        m_logger->warn("{} {} returned status {}", toString(method), url, response.status);
        throw ApiError::serverError(response.status);
    }
    return std::move(response.body);
}

// Not gated on connectivity: an upload is always attempted
std::string HttpManager::UploadMultipart(const MultipartUpload& upload, const ProgressCallback& progress) {
    const std::string boundary = Multipart::generateBoundary();
    const std::string body = Multipart::buildBody(upload.parameters, upload.files, boundary);

    Headers headers = upload.headers;
    for (auto it = headers.begin(); it != headers.end();) {
        if (iequals(it->first, "Content-Type")) {
            m_logger->warn("Ignoring caller Content-Type '{}' on multipart upload to {}", it->second, upload.url);
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    headers["Content-Type"] = Multipart::contentType(boundary);

    UploadProgress tracker(progress);
    Http::TransportResponse response = m_transport->Upload(
        upload.url, body, headers,
        [&tracker](std::uint64_t sent, std::uint64_t total) { tracker.tick(sent, total); });

    if (response.transportFailed) {
        throw ApiError::transportError(response.errorMessage);
    }
    if (response.status < 200 || response.status >= 300) {
        m_logger->warn("Upload to {} returned status {}", upload.url, response.status);
        throw ApiError::serverError(response.status);
    }

    tracker.complete();
    m_logger->info("Upload to {} complete ({} bytes sent, {} files)", upload.url, body.size(), upload.files.size());
    return std::move(response.body);
}

void HttpManager::OnConnectivityChanged(bool connected) {
    bool wasConnected;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        wasConnected = m_connected;
        m_connected = connected;
    }

    if (connected != wasConnected) {
        m_logger->info("Connectivity changed: {}", connected ? "connected" : "disconnected");
    }
    if (connected) {
        RetryPendingRequests();
    }
}

void HttpManager::RetryPendingRequests() {
    if (!IsConnected()) {
        return;
    }

    m_pending.drainAll([this](const Request& request) {
        try {
            Execute(request, {}, false);
            m_logger->info("Retried: {}", describe(request));
        } catch (const ApiError& e) {
            m_logger->warn("Retry failed for {}: {}", describe(request), e.userMessage());
        }
    });
}

bool HttpManager::IsConnected() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_connected;
}

std::size_t HttpManager::PendingCount() const {
    return m_pending.size();
}

std::vector<Request> HttpManager::PendingRequests() const {
    return m_pending.snapshot();
}

void HttpManager::AttachMonitor(ConnectivityMonitor& monitor) {
    DetachMonitor();

    // Requests issued right after attaching see the observed state, not the configured guess
    OnConnectivityChanged(monitor.checkOnce());

    std::lock_guard<std::mutex> lock(m_monitorMutex);
    monitor.start([this](bool satisfied) { OnConnectivityChanged(satisfied); });
    m_monitor = &monitor;
    m_logger->debug("Subscribed to connectivity monitor.");
}

void HttpManager::DetachMonitor() {
    std::lock_guard<std::mutex> lock(m_monitorMutex);
    if (m_monitor != nullptr) {
        m_monitor->stop();
        m_monitor = nullptr;
        m_logger->debug("Unsubscribed from connectivity monitor.");
    }
}

} // namespace Courier
