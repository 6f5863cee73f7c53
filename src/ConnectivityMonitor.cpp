// src/ConnectivityMonitor.cpp
#include <Courier/ConnectivityMonitor.hpp>
#include <Courier/Utils/Logger.hpp>

#include <cpr/cpr.h>
#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <string>
#include <system_error>

namespace Courier {

PollingConnectivityMonitor::PollingConnectivityMonitor(ProbeConfig config) : m_config(std::move(config)) {
    m_logger = Utils::Logger::GetOrCreateLogger("Connectivity");
}

PollingConnectivityMonitor::~PollingConnectivityMonitor() {
    stop();
}

void PollingConnectivityMonitor::start(Callback callback) {
    if (m_running) {
        m_logger->warn("Monitor already running; start() ignored.");
        return;
    }

    m_callback = std::move(callback);
    m_running = true;
    try {
        m_thread = std::thread(&PollingConnectivityMonitor::monitorLoop, this);
        m_logger->info("Started monitoring {} every {} ms", m_config.interfacesDir.string(), m_config.pollIntervalMs);
    } catch (const std::system_error& e) {
        m_logger->error("Failed to create monitor thread: {}", e.what());
        m_running = false;
        throw;
    }
}

void PollingConnectivityMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_running = false;
    }
    m_wake.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
        m_logger->info("Stopped monitoring");
    }
}

bool PollingConnectivityMonitor::anyInterfaceHasCarrier(const std::filesystem::path& interfacesDir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(interfacesDir, ec);
    if (ec) {
        return false;
    }

    for (const auto& entry : it) {
        if (entry.path().filename() == "lo") {
            continue;
        }
        std::ifstream carrier(entry.path() / "carrier");
        std::string status;
        if (carrier && std::getline(carrier, status) && status == "1") {
            return true;
        }
    }
    return false;
}

bool PollingConnectivityMonitor::checkOnce() const {
    if (!anyInterfaceHasCarrier(m_config.interfacesDir)) {
        return false;
    }
    if (!m_config.url) {
        return true;
    }

    cpr::Response r = cpr::Head(cpr::Url{*m_config.url}, cpr::Timeout{static_cast<std::int32_t>(m_config.pollIntervalMs)});
    if (r.error.code != cpr::ErrorCode::OK) {
        m_logger->debug("Probe {} failed: {}", *m_config.url, r.error.message);
        return false;
    }
    return true;
}

void PollingConnectivityMonitor::monitorLoop() {
    std::optional<bool> last;

    while (m_running) {
        const bool now = checkOnce();

        if (!last || *last != now) {
            if (last) {
                if (now) {
                    m_logger->info("Network connection restored");
                } else {
                    m_logger->warn("Network connection lost");
                }
            } else {
                m_logger->info("Initial network state: {}", now ? "connected" : "disconnected");
            }
            last = now;
            if (m_callback) {
                try {
                    m_callback(now);
                } catch (const std::exception& e) {
                    m_logger->error("Connectivity callback threw: {}", e.what());
                }
            }
        }

        std::unique_lock<std::mutex> lock(m_wakeMutex);
        m_wake.wait_for(lock, std::chrono::milliseconds(m_config.pollIntervalMs), [this] { return !m_running.load(); });
    }
}

} // namespace Courier
