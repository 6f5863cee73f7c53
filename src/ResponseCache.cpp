// src/ResponseCache.cpp
#include <Courier/ResponseCache.hpp>
#include <Courier/Utils/Logger.hpp>

#include <stdexcept>

namespace Courier {

ResponseCache::ResponseCache(std::unique_ptr<KeyValueStore> store) : m_store(std::move(store)) {
    if (!m_store) {
        throw std::invalid_argument("ResponseCache requires a backing store");
    }
    m_logger = Utils::Logger::GetOrCreateLogger("ResponseCache");
}

std::optional<std::string> ResponseCache::get(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto bytes = m_store->get(fingerprint);
    m_logger->trace("Cache {} for {}", bytes ? "hit" : "miss", fingerprint);
    return bytes;
}

void ResponseCache::put(const std::string& fingerprint, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_store->put(fingerprint, bytes)) {
        m_logger->trace("Cached {} bytes for {}", bytes.size(), fingerprint);
    }
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_store->clear();
    m_logger->info("Response cache cleared.");
}

} // namespace Courier
