// include/Courier/Config.hpp
#ifndef COURIER_CONFIG_HPP
#define COURIER_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace Courier {

    struct ProbeConfig {
        std::filesystem::path interfacesDir = "/sys/class/net";
        unsigned int pollIntervalMs = 2000;
        // When set, a HEAD request to this URL must also succeed for the host to count as connected
        std::optional<std::string> url;
    };

    struct Config {
        std::filesystem::path baseDataPath;
        std::filesystem::path cacheDir;
        std::filesystem::path logsDir;

        std::uint64_t cacheCapacityBytes = 50'000'000;
        std::string consoleLogLevel = "info";
        std::string fileLogLevel = "trace";
        std::string userAgent = "Courier/0.1";
        std::optional<std::filesystem::path> caBundle;

        ProbeConfig probe;

        // Initial connectivity state, before the monitor reports anything
        bool assumeConnected = false;

        Config(const std::filesystem::path& base = "./.courier_data");

        // Reads overrides from a JSON document. Keys that are absent keep their defaults.
        // Throws std::runtime_error naming the file on unreadable or malformed input.
        static Config fromJsonFile(const std::filesystem::path& file);

        // Creates baseDataPath, cacheDir and logsDir if they do not exist
        void ensureDirectories() const;
    };
}
#endif // COURIER_CONFIG_HPP
