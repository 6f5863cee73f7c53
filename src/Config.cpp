// src/Config.cpp
#include <Courier/Config.hpp>
#include <Courier/Utils/Logger.hpp>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace Courier {

Config::Config(const std::filesystem::path& base) : baseDataPath(base) {
    cacheDir = baseDataPath / "cache";
    logsDir = baseDataPath / "logs";
}

void Config::ensureDirectories() const {
    auto create_dir_if_not_exists = [](const std::filesystem::path& p, const std::string& name) {
        if (std::filesystem::exists(p)) {
            return;
        }
        std::error_code ec;
        std::filesystem::create_directories(p, ec);
        if (ec) {
            throw std::runtime_error("Failed to create " + name + " directory " + p.string() + ": " + ec.message());
        }
    };

    create_dir_if_not_exists(baseDataPath, "base data");
    create_dir_if_not_exists(cacheDir, "cache");
    create_dir_if_not_exists(logsDir, "logs");
}

Config Config::fromJsonFile(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + file.string());
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + file.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file " + file.string() + " must contain a JSON object");
    }

    try {
        Config config(j.value("dataDir", std::string("./.courier_data")));

        config.cacheCapacityBytes = j.value("cacheCapacityBytes", config.cacheCapacityBytes);
        config.consoleLogLevel = j.value("consoleLogLevel", config.consoleLogLevel);
        config.fileLogLevel = j.value("fileLogLevel", config.fileLogLevel);
        config.userAgent = j.value("userAgent", config.userAgent);
        config.assumeConnected = j.value("assumeConnected", config.assumeConnected);
        if (j.contains("caBundle")) {
            config.caBundle = j.at("caBundle").get<std::string>();
        }

        if (j.contains("probe")) {
            const json& probe = j.at("probe");
            config.probe.interfacesDir = probe.value("interfacesDir", config.probe.interfacesDir.string());
            if (probe.contains("pollIntervalMs")) {
                const json& interval = probe.at("pollIntervalMs");
                // Doubles as the probe's HEAD timeout, which cpr takes as a signed 32-bit value
                if (!interval.is_number_unsigned() || interval.get<std::uint64_t>() == 0 ||
                    interval.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
                    throw std::runtime_error("probe.pollIntervalMs in " + file.string() + " must be a positive number of milliseconds");
                }
                config.probe.pollIntervalMs = interval.get<unsigned int>();
            }
            if (probe.contains("url")) {
                config.probe.url = probe.at("url").get<std::string>();
            }
        }

        CORE_LOG_TRACE("[Config] Loaded {} (data dir: {})", file.string(), config.baseDataPath.string());
        return config;
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + file.string() + ": " + e.what());
    }
}

} // namespace Courier
