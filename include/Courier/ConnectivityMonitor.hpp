// include/Courier/ConnectivityMonitor.hpp
#ifndef COURIER_CONNECTIVITY_MONITOR_HPP
#define COURIER_CONNECTIVITY_MONITOR_HPP

#include <Courier/Config.hpp>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <spdlog/logger.h>

namespace Courier {

    /**
     * Source of reachability transitions.
     *
     * The callback runs on the monitor's own thread with `true` when the network
     * path is satisfied. It fires for the first observation and on every change
     * afterwards, without debouncing.
     */
    class ConnectivityMonitor {
    public:
        using Callback = std::function<void(bool satisfied)>;

        virtual ~ConnectivityMonitor() = default;

        virtual void start(Callback callback) = 0;
        // Blocks until no callback is running and none will run again
        virtual void stop() = 0;
        virtual bool isRunning() const = 0;

        // Observes the current state on the calling thread, without notifying anyone
        virtual bool checkOnce() const = 0;
    };

    // Polls interface carrier state under ProbeConfig::interfacesDir and, if configured,
    // a HEAD request to ProbeConfig::url.
    class PollingConnectivityMonitor : public ConnectivityMonitor {
    public:
        explicit PollingConnectivityMonitor(ProbeConfig config);
        ~PollingConnectivityMonitor() override;

        PollingConnectivityMonitor(const PollingConnectivityMonitor&) = delete;
        PollingConnectivityMonitor& operator=(const PollingConnectivityMonitor&) = delete;

        void start(Callback callback) override;
        void stop() override;
        bool isRunning() const override { return m_running; }

        // True if any interface other than loopback reports carrier "1"
        static bool anyInterfaceHasCarrier(const std::filesystem::path& interfacesDir);

        bool checkOnce() const override;

    private:
        void monitorLoop();

        ProbeConfig m_config;
        Callback m_callback;
        std::atomic<bool> m_running{false};
        std::mutex m_wakeMutex;
        std::condition_variable m_wake;
        std::thread m_thread;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Courier

#endif // COURIER_CONNECTIVITY_MONITOR_HPP
