// include/Courier/ResponseCache.hpp
#ifndef COURIER_RESPONSE_CACHE_HPP
#define COURIER_RESPONSE_CACHE_HPP

#include <Courier/KeyValueStore.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Courier {

    // Last known good response bytes per fingerprint. No freshness checks and
    // no eviction here; size bounding belongs to the underlying store.
    // Safe for concurrent readers and writers, last write wins.
    class ResponseCache {
    public:
        explicit ResponseCache(std::unique_ptr<KeyValueStore> store);

        std::optional<std::string> get(const std::string& fingerprint) const;
        void put(const std::string& fingerprint, const std::string& bytes);
        void clear();

    private:
        mutable std::mutex m_mutex;
        std::unique_ptr<KeyValueStore> m_store;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Courier

#endif // COURIER_RESPONSE_CACHE_HPP
