#pragma once

#include "taildrive/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace taildrive {

/**
 * @brief Desktop node settings (status/sync HTTP service)
 */
struct ServerConfig {
    uint16_t port = 8080;
    std::string bind_address = "0.0.0.0";
    std::size_t worker_threads = 4;
    std::string local_api_socket = "/var/run/tailscale/tailscaled.sock";
    std::filesystem::path upload_root;                 ///< Target of PUT /upload/{path}
    std::filesystem::path config_dir;                  ///< Holds sync_projects.json
    int monitor_interval_seconds = 5;                  ///< Inbox fallback and peer refresh
    int watcher_retry_seconds = 5;                     ///< Back-off before re-opening the event bus
    std::size_t max_body_bytes = std::size_t{1} << 30;
    std::string log_level = "info";
    std::string log_file;
};

/**
 * @brief Mobile node settings (poll loop and foreground facade)
 */
struct ClientConfig {
    std::string server_url = "http://127.0.0.1:8080";
    std::filesystem::path storage_dir;                 ///< peers.json, sync_projects.json
    std::filesystem::path save_directory;              ///< Downloads and pulls land here
    int poll_interval_ms = 3000;
    int tick_ms = 100;
    int http_timeout_ms = 8000;
    std::string log_level = "info";
    std::string log_file;
};

/**
 * @brief $HOME, or the current directory when HOME is unset
 */
std::filesystem::path home_directory();

ServerConfig default_server_config();
ClientConfig default_client_config();

/**
 * @brief Overlay the keys present in `doc` onto `base`; absent keys keep
 *        their value, a key of the wrong type is an error
 */
Result<ServerConfig> server_config_from_json(const nlohmann::json& doc, ServerConfig base);
Result<ClientConfig> client_config_from_json(const nlohmann::json& doc, ClientConfig base);

Result<ServerConfig> load_server_config(const std::filesystem::path& file);
Result<ClientConfig> load_client_config(const std::filesystem::path& file);

/**
 * @brief Defaults, then `--config FILE` if given, then the remaining flags
 *
 * Desktop flags: -p/--port, -d/--data (upload root), -s/--socket,
 * --config-dir, -v/--verbose.
 */
Result<ServerConfig> parse_server_args(int argc, const char* const argv[]);

/**
 * Mobile flags: --server URL, --storage DIR, -d/--data (save directory),
 * -v/--verbose.
 */
Result<ClientConfig> parse_client_args(int argc, const char* const argv[]);

} // namespace taildrive
