// include/Courier/Utils/Logger.hpp
#ifndef COURIER_LOGGER_HPP
#define COURIER_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace Courier::Utils {

    class Logger {
    public:
        // Call this once at startup, before any component is constructed
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "courier.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        // The "Core" logger, used by the CORE_LOG_* macros
        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Named logger sharing the sinks created by Init()
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void SetLevel(const std::string &loggerName, spdlog::level::level_enum level);

        // Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
        // Unknown names fall back to `fallback`.
        static spdlog::level::level_enum ParseLevel(const std::string &name, spdlog::level::level_enum fallback);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace Courier::Utils

#define CORE_LOG_TRACE(...)    if(auto& logger = ::Courier::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define CORE_LOG_INFO(...)     if(auto& logger = ::Courier::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define CORE_LOG_WARN(...)     if(auto& logger = ::Courier::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define CORE_LOG_ERROR(...)    if(auto& logger = ::Courier::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define CORE_LOG_CRITICAL(...) if(auto& logger = ::Courier::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // COURIER_LOGGER_HPP
