// src/main.cpp
#include <Courier/ApiError.hpp>
#include <Courier/Config.hpp>
#include <Courier/ConnectivityMonitor.hpp>
#include <Courier/Http.hpp>
#include <Courier/HttpManager.hpp>
#include <Courier/KeyValueStore.hpp>
#include <Courier/ResponseCache.hpp>
#include <Courier/Utils/Logger.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cerr << "Usage: courier-cli [--config <file>] <GET|POST|PUT|DELETE|UPLOAD> <url> [body | file-to-upload]" << std::endl;
}

std::optional<Courier::Request> buildRequest(const std::string& verb, const std::string& url, const std::optional<std::string>& argument) {
    if (verb == "GET") {
        return Courier::GetRequest{url, {}};
    }
    if (verb == "POST") {
        return Courier::PostRequest{url, argument, {}};
    }
    if (verb == "PUT") {
        return Courier::RestRequest{url, Courier::HttpMethod::Put, argument, {}};
    }
    if (verb == "DELETE") {
        return Courier::RestRequest{url, Courier::HttpMethod::Delete, argument, {}};
    }
    if (verb == "UPLOAD" && argument) {
        std::ifstream in(*argument, std::ios::binary);
        if (!in) {
            CORE_LOG_ERROR("Cannot open file to upload: {}", *argument);
            return std::nullopt;
        }
        Courier::FileAttachment file;
        file.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        file.fileName = std::filesystem::path(*argument).filename().string();
        file.mimeType = "application/octet-stream";
        return Courier::MultipartUpload{url, {}, {file}, {}};
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<std::filesystem::path> configFile;
    if (args.size() >= 2 && args[0] == "--config") {
        configFile = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.size() < 2) {
        printUsage();
        return 2;
    }

    Courier::Config config;
    try {
        if (configFile) {
            config = Courier::Config::fromJsonFile(*configFile);
        }
        config.ensureDirectories();
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    Courier::Utils::Logger::Init(config.logsDir, "courier.log",
        Courier::Utils::Logger::ParseLevel(config.consoleLogLevel, spdlog::level::info),
        Courier::Utils::Logger::ParseLevel(config.fileLogLevel, spdlog::level::trace));

    CORE_LOG_INFO("Courier v0.1 starting...");
    CORE_LOG_INFO("Data directory: {}", config.baseDataPath.string());

    const std::string& verb = args[0];
    const std::string& url = args[1];
    std::optional<std::string> argument;
    if (args.size() >= 3) {
        argument = args[2];
    }

    std::optional<Courier::Request> request = buildRequest(verb, url, argument);
    if (!request) {
        printUsage();
        spdlog::shutdown();
        return 2;
    }

    auto transport = std::make_shared<Courier::Http::CprTransport>(config);
    auto cache = std::make_shared<Courier::ResponseCache>(
        std::make_unique<Courier::FileKeyValueStore>(config.cacheDir, config.cacheCapacityBytes));
    Courier::HttpManager manager(config, transport, cache);

    // Blocks for the first connectivity check before any request is issued
    Courier::PollingConnectivityMonitor monitor(config.probe);
    manager.AttachMonitor(monitor);

    int exitCode = 0;
    try {
        std::string body = manager.Handle(*request, [](double fraction) {
            CORE_LOG_INFO("Upload progress: {:.0f}%", fraction * 100.0);
        });
        std::cout << body << std::endl;
        CORE_LOG_INFO("{} {} finished. Size: {} bytes", verb, url, body.size());
    } catch (const Courier::ApiError& e) {
        CORE_LOG_ERROR("{} {} failed: {} ({})", verb, url, e.what(), Courier::toString(e.kind()));
        std::cerr << e.userMessage() << std::endl;
        if (manager.PendingCount() > 0) {
            CORE_LOG_WARN("{} request(s) queued; they are only retried while this process runs.", manager.PendingCount());
        }
        exitCode = 1;
    }

    manager.DetachMonitor();
    spdlog::shutdown();
    return exitCode;
}
