// src/KeyValueStore.cpp
#include <Courier/KeyValueStore.hpp>
#include <Courier/Fingerprint.hpp>
#include <Courier/Utils/Logger.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace Courier {

// --- MemoryKeyValueStore ---

MemoryKeyValueStore::MemoryKeyValueStore(std::uint64_t capacityBytes) : m_capacityBytes(capacityBytes) {}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) const {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::put(const std::string& key, const std::string& bytes) {
    auto it = m_entries.find(key);
    const std::uint64_t previous = it != m_entries.end() ? it->second.size() : 0;
    const std::uint64_t newSize = m_sizeBytes - previous + bytes.size();
    if (newSize > m_capacityBytes) {
        return false;
    }
    m_entries[key] = bytes;
    m_sizeBytes = newSize;
    return true;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        m_sizeBytes -= it->second.size();
        m_entries.erase(it);
    }
}

void MemoryKeyValueStore::clear() {
    m_entries.clear();
    m_sizeBytes = 0;
}

// --- FileKeyValueStore ---

FileKeyValueStore::FileKeyValueStore(const std::filesystem::path& directory, std::uint64_t capacityBytes)
    : m_directory(directory), m_capacityBytes(capacityBytes) {
    m_logger = Utils::Logger::GetOrCreateLogger("ResponseCache");

    if (!std::filesystem::exists(m_directory)) {
        m_logger->info("Cache directory {} does not exist. Creating.", m_directory.string());
        std::filesystem::create_directories(m_directory);
    }

    // Entries written by earlier runs count against the capacity
    for (const auto& entry : std::filesystem::directory_iterator(m_directory)) {
        if (entry.is_regular_file() && entry.path().extension() == kEntryExtension) {
            m_sizeBytes += entry.file_size();
        }
    }
    m_logger->trace("Opened cache store {} ({} of {} bytes used).", m_directory.string(), m_sizeBytes, m_capacityBytes);
}

std::filesystem::path FileKeyValueStore::pathFor(const std::string& key) const {
    return m_directory / (storageKey(key) + kEntryExtension);
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) const {
    std::ifstream in(pathFor(key), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        m_logger->warn("Failed to read cache entry for {}", key);
        return std::nullopt;
    }
    return bytes;
}

bool FileKeyValueStore::put(const std::string& key, const std::string& bytes) {
    const std::filesystem::path path = pathFor(key);

    std::error_code ec;
    const std::uint64_t previous = std::filesystem::exists(path) ? std::filesystem::file_size(path, ec) : 0;
    if (ec) {
        throw std::runtime_error("Cannot stat cache entry " + path.string() + ": " + ec.message());
    }

    const std::uint64_t newSize = m_sizeBytes - previous + bytes.size();
    if (newSize > m_capacityBytes) {
        m_logger->warn("Not caching {} ({} bytes): store capacity of {} bytes would be exceeded.", key, bytes.size(), m_capacityBytes);
        return false;
    }

    writeAtomic(path, bytes);
    m_sizeBytes = newSize;
    return true;
}

void FileKeyValueStore::remove(const std::string& key) {
    const std::filesystem::path path = pathFor(key);
    std::error_code ec;
    const std::uint64_t size = std::filesystem::exists(path) ? std::filesystem::file_size(path, ec) : 0;
    if (!ec && std::filesystem::remove(path, ec)) {
        m_sizeBytes -= size;
    }
    if (ec) {
        m_logger->warn("Failed to remove cache entry {}: {}", path.string(), ec.message());
    }
}

void FileKeyValueStore::clear() {
    for (const auto& entry : std::filesystem::directory_iterator(m_directory)) {
        if (entry.is_regular_file() && entry.path().extension() == kEntryExtension) {
            std::filesystem::remove(entry.path());
        }
    }
    m_sizeBytes = 0;
}

void FileKeyValueStore::writeAtomic(const std::filesystem::path& p, const std::string& bytes) {
    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("open failed: " + tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("write failed: " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, p);
}

} // namespace Courier
