// include/Courier/HttpManager.hpp
#ifndef COURIER_HTTP_MANAGER_HPP
#define COURIER_HTTP_MANAGER_HPP

#include <Courier/Config.hpp>
#include <Courier/ConnectivityMonitor.hpp>
#include <Courier/Http.hpp>
#include <Courier/PendingQueue.hpp>
#include <Courier/ResponseCache.hpp>
#include <Courier/Types/Request.hpp>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Courier {

    /**
     * Issues requests, keeps the last good response per endpoint, and replays
     * requests that failed while offline once connectivity returns.
     *
     * Construct one per process (or per test) and hand it to whoever needs it.
     * Handle() may be called from any number of threads; connectivity state, the
     * pending queue and cache writes are serialized internally. No deadline is
     * applied to transport calls: they run until the transport completes or fails.
     */
    class HttpManager {
    public:
        // Upload progress as a fraction in [0, 1], never decreasing within one upload
        using ProgressCallback = std::function<void(double fraction)>;

        HttpManager(const Config& config,
                    std::shared_ptr<Http::Transport> transport,
                    std::shared_ptr<ResponseCache> cache);
        ~HttpManager();

        HttpManager(const HttpManager&) = delete;
        HttpManager& operator=(const HttpManager&) = delete;

        /**
         * @brief Executes `request` and returns the response body.
         *
         * While disconnected, a cached body for the request's fingerprint is returned
         * without touching the transport. A successful live response replaces the
         * cached body. A failure while disconnected queues the request for one retry
         * on reconnect; the error is thrown either way.
         *
         * @throws ApiError NetworkUnavailable, InvalidResponse, ServerError or TransportError.
         */
        std::string Handle(const Request& request, const ProgressCallback& progress = {});

        // Runs Handle() on its own thread. The manager must outlive the returned future.
        std::future<std::string> HandleAsync(Request request, ProgressCallback progress = {});

        // Entry point for connectivity reports. Reporting "connected" starts a drain pass
        // on the calling thread.
        void OnConnectivityChanged(bool connected);

        bool IsConnected() const;
        std::size_t PendingCount() const;
        std::vector<Request> PendingRequests() const;

        // Seeds the connectivity state from monitor.checkOnce(), then subscribes to `monitor`,
        // which must stay alive until DetachMonitor() or destruction
        void AttachMonitor(ConnectivityMonitor& monitor);
        void DetachMonitor();

    private:
        std::shared_ptr<Http::Transport> m_transport;
        std::shared_ptr<ResponseCache> m_cache;
        PendingQueue m_pending;

        mutable std::mutex m_stateMutex;
        bool m_connected;

        std::mutex m_monitorMutex;
        ConnectivityMonitor* m_monitor = nullptr;

        std::shared_ptr<spdlog::logger> m_logger;

        std::string Execute(const Request& request, const ProgressCallback& progress, bool queueOnOfflineFailure);
        std::string Dispatch(const Request& request, const ProgressCallback& progress);

        std::string FetchData(const GetRequest& request);
        std::string SendData(HttpMethod method, const std::string& url,
                             const std::optional<std::string>& body, const Headers& headers);
        std::string UploadMultipart(const MultipartUpload& upload, const ProgressCallback& progress);

        void RetryPendingRequests();
        void RequireConnection(const std::string& url) const;
    };

} // namespace Courier

#endif // COURIER_HTTP_MANAGER_HPP
