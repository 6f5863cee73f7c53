// include/Courier/PendingQueue.hpp
#ifndef COURIER_PENDING_QUEUE_HPP
#define COURIER_PENDING_QUEUE_HPP

#include <Courier/Types/Request.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <spdlog/logger.h>

namespace Courier {

    // Requests that failed while offline, replayed once on reconnect.
    // In memory only; nothing survives a restart.
    class PendingQueue {
    public:
        using Handler = std::function<void(const Request&)>;

        PendingQueue();

        // No deduplication: the same request appended twice is replayed twice
        void append(Request request);

        /**
         * Runs `handler` on every entry present when the pass starts, front to back,
         * then removes those entries whatever the outcome. An exception from the
         * handler is logged and the pass moves on. Entries appended while the pass
         * runs are left for the next pass. Returns the number of entries attempted.
         */
        std::size_t drainAll(const Handler& handler);

        std::size_t size() const;
        std::vector<Request> snapshot() const;

    private:
        mutable std::mutex m_mutex;
        std::mutex m_drainMutex;
        std::deque<Request> m_requests;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Courier

#endif // COURIER_PENDING_QUEUE_HPP
