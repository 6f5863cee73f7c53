// src/PendingQueue.cpp
#include <Courier/PendingQueue.hpp>
#include <Courier/Utils/Logger.hpp>

#include <algorithm>
#include <exception>

namespace Courier {

PendingQueue::PendingQueue() {
    m_logger = Utils::Logger::GetOrCreateLogger("PendingQueue");
}

void PendingQueue::append(Request request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_logger->info("Queued for retry: {}", describe(request));
    m_requests.push_back(std::move(request));
}

std::size_t PendingQueue::drainAll(const Handler& handler) {
    // One pass at a time, so a second pass never erases entries the first has not attempted
    std::lock_guard<std::mutex> drainLock(m_drainMutex);

    std::vector<Request> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.assign(m_requests.begin(), m_requests.end());
    }
    if (batch.empty()) {
        return 0;
    }

    m_logger->info("Retrying {} pending request(s).", batch.size());
    for (const auto& request : batch) {
        try {
            handler(request);
        } catch (const std::exception& e) {
            m_logger->warn("Retry handler failed for {}: {}", describe(request), e.what());
        }
    }

    // The batch is the front of the queue; anything behind it arrived during the pass
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::size_t drained = std::min(batch.size(), m_requests.size());
    m_requests.erase(m_requests.begin(), m_requests.begin() + static_cast<std::ptrdiff_t>(drained));
    return batch.size();
}

std::size_t PendingQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests.size();
}

std::vector<Request> PendingQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_requests.begin(), m_requests.end()};
}

} // namespace Courier
