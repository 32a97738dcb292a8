#include "utils/logger.h"
#include "utils/config_loader.h"
#include "storage/product_store.h"
#include "server/http_server.h"

#include <iostream>
#include <csignal>
#include <memory>
#include <optional>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace catalog;
using json = nlohmann::json;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true);
    }
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --host HOST        Server host (default: 0.0.0.0)\n"
              << "  --port PORT        Server port (default: 8080)\n"
              << "  --threads N        Number of worker threads (default: auto)\n"
              << "  --config FILE      Load server/logging config from JSON or YAML file\n"
              << "  --log-level LEVEL  trace|debug|info|warn|error|critical (default: info)\n"
              << "  --log-file FILE    Log file path (default: catalog_server.log, empty = console only)\n"
              << "  --help, -h         Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // Command line values; applied after the config file so they win
    std::optional<std::string> host_arg;
    std::optional<uint16_t> port_arg;
    std::optional<size_t> threads_arg;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level_arg;
    std::optional<std::string> log_file_arg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--host" && i + 1 < argc) {
                host_arg = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                int p = std::stoi(argv[++i]);
                if (p < 0 || p > 65535) throw std::out_of_range("port");
                port_arg = static_cast<uint16_t>(p);
            } else if (arg == "--threads" && i + 1 < argc) {
                threads_arg = std::stoul(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level_arg = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                log_file_arg = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric option value (" << e.what() << ")\n";
        return 1;
    }

    // Config file is read before logging so it can choose the log sink
    std::optional<json> cfg;
    std::string cfg_source;
    if (config_path) {
        cfg = utils::ConfigLoader::loadFile(*config_path);
        if (!cfg) {
            std::cerr << "Failed to read config file: " << *config_path << "\n";
            return 1;
        }
        cfg_source = *config_path;
    } else if (auto found = utils::ConfigLoader::loadFirst(utils::ConfigLoader::defaultSearchPaths())) {
        cfg_source = found->first;
        cfg = std::move(found->second);
    }

    std::string log_file = "catalog_server.log";
    std::string log_level = "info";
    if (cfg && cfg->contains("logging") && (*cfg)["logging"].is_object()) {
        const auto& lg = (*cfg)["logging"];
        log_file = lg.value("file", log_file);
        log_level = lg.value("level", log_level);
    }
    if (log_file_arg) log_file = *log_file_arg;
    if (log_level_arg) log_level = *log_level_arg;

    utils::Logger::init(log_file, utils::Logger::levelFromString(log_level));

    CATALOG_INFO("=== Catalog Product API Server ===");
    CATALOG_INFO("Version: 0.1.0");
    if (!cfg_source.empty()) {
        CATALOG_INFO("Loaded config from {}", cfg_source);
    }

    int exit_code = 0;
    try {
        server::HttpServer::Config server_config;
        if (cfg && cfg->contains("server")) {
            server_config.applyJson((*cfg)["server"]);
        }
        if (host_arg) server_config.host = *host_arg;
        if (port_arg) server_config.port = *port_arg;
        if (threads_arg && *threads_arg > 0) server_config.num_threads = *threads_arg;

        // The store lives exactly as long as this process run
        auto store = std::make_shared<ProductStore>();
        auto http_server = std::make_unique<server::HttpServer>(server_config, *store);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        http_server->start();

        CATALOG_INFO("Catalog server is running at http://{}:{}", server_config.host, http_server->boundPort());
        CATALOG_INFO("Available endpoints:");
        CATALOG_INFO("  POST /api/produtos  - Create product");
        CATALOG_INFO("  GET  /api/produtos  - List products");
        CATALOG_INFO("  GET  /health        - Health check");
        CATALOG_INFO("  GET  /stats         - Server and store counters");

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        CATALOG_INFO("Received shutdown signal...");
        http_server->stop();
        http_server.reset();
        CATALOG_INFO("Discarding {} in-memory product(s)", store->size());
    } catch (const std::exception& e) {
        CATALOG_CRITICAL("Fatal error: {}", e.what());
        exit_code = 1;
    }

    CATALOG_INFO("Shutdown complete");
    utils::Logger::shutdown();
    return exit_code;
}
