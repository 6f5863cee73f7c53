// include/Courier/KeyValueStore.hpp
#ifndef COURIER_KEY_VALUE_STORE_HPP
#define COURIER_KEY_VALUE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Courier {

    // Byte blobs addressed by string keys. Implementations are not thread-safe;
    // ResponseCache serializes every call.
    class KeyValueStore {
    public:
        virtual ~KeyValueStore() = default;

        virtual std::optional<std::string> get(const std::string& key) const = 0;
        // Returns false when the write would exceed the store's capacity; the previous value is kept
        virtual bool put(const std::string& key, const std::string& bytes) = 0;
        virtual void remove(const std::string& key) = 0;
        virtual void clear() = 0;
        virtual std::uint64_t sizeBytes() const = 0;
    };

    class MemoryKeyValueStore : public KeyValueStore {
    public:
        explicit MemoryKeyValueStore(std::uint64_t capacityBytes = UINT64_MAX);

        std::optional<std::string> get(const std::string& key) const override;
        bool put(const std::string& key, const std::string& bytes) override;
        void remove(const std::string& key) override;
        void clear() override;
        std::uint64_t sizeBytes() const override { return m_sizeBytes; }

    private:
        std::uint64_t m_capacityBytes;
        std::uint64_t m_sizeBytes = 0;
        std::map<std::string, std::string> m_entries;
    };

    // One file per key under `directory`, named by the SHA-256 of the key.
    // Writes go to a temporary file first and are renamed into place.
    class FileKeyValueStore : public KeyValueStore {
    public:
        FileKeyValueStore(const std::filesystem::path& directory, std::uint64_t capacityBytes);

        std::optional<std::string> get(const std::string& key) const override;
        bool put(const std::string& key, const std::string& bytes) override;
        void remove(const std::string& key) override;
        void clear() override;
        std::uint64_t sizeBytes() const override { return m_sizeBytes; }

        std::filesystem::path pathFor(const std::string& key) const;

    private:
        std::filesystem::path m_directory;
        std::uint64_t m_capacityBytes;
        std::uint64_t m_sizeBytes = 0;
        std::shared_ptr<spdlog::logger> m_logger;

        static constexpr const char* kEntryExtension = ".blob";
        static void writeAtomic(const std::filesystem::path& p, const std::string& bytes);
    };

} // namespace Courier

#endif // COURIER_KEY_VALUE_STORE_HPP
