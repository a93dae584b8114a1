/**
 * @file desktop_server.cpp
 * @brief Desktop node: status/sync HTTP service in front of the overlay daemon
 *
 * Run with:
 *   ./build/taildrive-desktop --port 8080 --data ~/Taildrive
 *
 * Test with:
 *   curl http://localhost:8080/status
 *   curl http://localhost:8080/peers
 *   curl -X POST http://localhost:8080/sync/projects \
 *        -d '{"local_path":"/home/me/notes.md","remote_path":"/sdcard/notes.md"}'
 *   curl http://localhost:8080/sync/check
 */

#include "taildrive/core/config.hpp"
#include "taildrive/core/logging.hpp"
#include "taildrive/network/http_client.hpp"
#include "taildrive/network/http_router.hpp"
#include "taildrive/network/http_server_asio.hpp"
#include "taildrive/server/backend_monitor.hpp"
#include "taildrive/server/file_sender.hpp"
#include "taildrive/server/inbound_watcher.hpp"
#include "taildrive/server/local_api_backend.hpp"
#include "taildrive/server/state.hpp"
#include "taildrive/server/status_service.hpp"
#include "taildrive/server/sync_project_table.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace taildrive;
using namespace taildrive::server;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  -p, --port PORT       HTTP port (default 8080)\n"
              << "  -d, --data DIR        Upload root for PUT /upload\n"
              << "  -s, --socket PATH     Overlay daemon control socket\n"
              << "      --config-dir DIR  Where sync_projects.json is kept\n"
              << "  -v, --verbose         Debug logging\n";
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    auto parsed = parse_server_args(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    const ServerConfig config = parsed.value();

    auto logging = init_logging(config.log_level, config.log_file);
    if (logging.is_error()) {
        std::cerr << logging.error() << "\n";
        return 2;
    }

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Taildrive desktop node");
    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Upload root:   {}", config.upload_root.string());
    spdlog::info("Config dir:    {}", config.config_dir.string());
    spdlog::info("Daemon socket: {}", config.local_api_socket);

    SyncProjectTable projects(config.config_dir / "sync_projects.json");
    auto loaded = projects.load();
    if (loaded.is_error()) {
        spdlog::error("Cannot load sync projects: {}", loaded.error());
        return 1;
    }

    auto transport = std::make_shared<network::AsioHttpTransport>(
        network::Endpoint::unix_socket(config.local_api_socket, kLocalApiHost),
        std::chrono::seconds(10));
    LocalApiBackend backend(transport);

    ServerState state;
    FileSender sender(backend, state.sent);

    StatusService service(state, projects, backend, sender,
                          StatusService::Options{config.upload_root, home_directory()});

    network::HttpRouter router;
    service.register_routes(router);

    spdlog::info("Registered routes:");
    for (const auto& route : router.list_routes()) {
        spdlog::info("  {}", route);
    }

    network::HttpServerAsio http(config.bind_address, config.port, config.worker_threads,
                                 config.max_body_bytes);
    http.set_handler([&router](const network::HttpRequest& request) {
        return router.handle_request(request);
    });

    auto started = http.start();
    if (started.is_error()) {
        spdlog::error("{}", started.error());
        return 1;
    }

    BackendMonitor monitor(backend, state, std::chrono::seconds(config.monitor_interval_seconds));
    InboundWatcher watcher(backend,
                           [&state](const model::InboundFile& file) { state.received.record(file); },
                           std::chrono::seconds(config.watcher_retry_seconds));
    monitor.start();
    watcher.start();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Server running on http://{}:{}", config.bind_address, http.get_port());
    spdlog::info("Press Ctrl+C to stop");

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down...");
    watcher.stop();
    monitor.stop();
    http.stop();
    sender.wait_idle();
    spdlog::info("Server stopped");
    return 0;
}
