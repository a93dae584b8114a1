#include "taildrive/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace taildrive {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<json> read_json_file(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        return Err("Cannot open config file " + file.string());
    }
    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Err("Config file " + file.string() + " is not valid JSON");
    }
    if (!doc.is_object()) {
        return Err("Config file " + file.string() + " must contain a JSON object");
    }
    return Ok(std::move(doc));
}

Result<long> parse_number(const std::string& flag, const std::string& text, long min, long max) {
    try {
        std::size_t consumed = 0;
        const long value = std::stol(text, &consumed);
        if (consumed != text.size() || value < min || value > max) {
            return Err("Invalid value for " + flag + ": " + text);
        }
        return Ok(value);
    } catch (const std::exception&) {
        return Err("Invalid value for " + flag + ": " + text);
    }
}

// Returns the value of --config/-c, or empty
Result<std::string> find_config_file(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return Err(arg + " requires a value");
            }
            return Ok(std::string(argv[i + 1]));
        }
    }
    return Ok(std::string());
}

} // namespace

fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

ServerConfig default_server_config() {
    ServerConfig config;
    const auto home = home_directory();
    config.upload_root = home / "Taildrive";
    config.config_dir = home / ".config" / "taildrive";
    return config;
}

ClientConfig default_client_config() {
    ClientConfig config;
    const auto home = home_directory();
    config.storage_dir = home / ".local" / "share" / "taildrive";
    config.save_directory = home / "Downloads";
    return config;
}

Result<ServerConfig> server_config_from_json(const json& doc, ServerConfig base) {
    try {
        base.port = doc.value("port", base.port);
        base.bind_address = doc.value("bind_address", base.bind_address);
        base.worker_threads = doc.value("worker_threads", base.worker_threads);
        base.local_api_socket = doc.value("local_api_socket", base.local_api_socket);
        base.upload_root = doc.value("upload_root", base.upload_root.string());
        base.config_dir = doc.value("config_dir", base.config_dir.string());
        base.monitor_interval_seconds = doc.value("monitor_interval_seconds", base.monitor_interval_seconds);
        base.watcher_retry_seconds = doc.value("watcher_retry_seconds", base.watcher_retry_seconds);
        base.max_body_bytes = doc.value("max_body_bytes", base.max_body_bytes);
        base.log_level = doc.value("log_level", base.log_level);
        base.log_file = doc.value("log_file", base.log_file);
    } catch (const json::exception& e) {
        return Err(std::string("Invalid desktop config: ") + e.what());
    }
    if (base.worker_threads == 0) {
        return Err(std::string("worker_threads must be at least 1"));
    }
    if (base.monitor_interval_seconds <= 0 || base.watcher_retry_seconds <= 0) {
        return Err(std::string("Intervals must be positive"));
    }
    return Ok(std::move(base));
}

Result<ClientConfig> client_config_from_json(const json& doc, ClientConfig base) {
    try {
        base.server_url = doc.value("server_url", base.server_url);
        base.storage_dir = doc.value("storage_dir", base.storage_dir.string());
        base.save_directory = doc.value("save_directory", base.save_directory.string());
        base.poll_interval_ms = doc.value("poll_interval_ms", base.poll_interval_ms);
        base.tick_ms = doc.value("tick_ms", base.tick_ms);
        base.http_timeout_ms = doc.value("http_timeout_ms", base.http_timeout_ms);
        base.log_level = doc.value("log_level", base.log_level);
        base.log_file = doc.value("log_file", base.log_file);
    } catch (const json::exception& e) {
        return Err(std::string("Invalid mobile config: ") + e.what());
    }
    if (base.poll_interval_ms <= 0 || base.tick_ms <= 0 || base.http_timeout_ms <= 0) {
        return Err(std::string("Intervals and timeouts must be positive"));
    }
    return Ok(std::move(base));
}

Result<ServerConfig> load_server_config(const fs::path& file) {
    auto doc = read_json_file(file);
    if (doc.is_error()) {
        return Err(doc.error());
    }
    return server_config_from_json(doc.value(), default_server_config());
}

Result<ClientConfig> load_client_config(const fs::path& file) {
    auto doc = read_json_file(file);
    if (doc.is_error()) {
        return Err(doc.error());
    }
    return client_config_from_json(doc.value(), default_client_config());
}

Result<ServerConfig> parse_server_args(int argc, const char* const argv[]) {
    auto config_file = find_config_file(argc, argv);
    if (config_file.is_error()) {
        return Err(config_file.error());
    }

    ServerConfig config = default_server_config();
    if (!config_file.value().empty()) {
        auto loaded = load_server_config(config_file.value());
        if (loaded.is_error()) {
            return Err(loaded.error());
        }
        config = std::move(loaded.value());
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "-c" || arg == "--config") {
            ++i;
        } else if ((arg == "-p" || arg == "--port") && has_value) {
            auto port = parse_number(arg, argv[++i], 0, 65535);
            if (port.is_error()) {
                return Err(port.error());
            }
            config.port = static_cast<uint16_t>(port.value());
        } else if ((arg == "-d" || arg == "--data") && has_value) {
            config.upload_root = argv[++i];
        } else if ((arg == "-s" || arg == "--socket") && has_value) {
            config.local_api_socket = argv[++i];
        } else if (arg == "--config-dir" && has_value) {
            config.config_dir = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.log_level = "debug";
        } else {
            return Err("Unknown or incomplete option: " + arg);
        }
    }
    return Ok(std::move(config));
}

Result<ClientConfig> parse_client_args(int argc, const char* const argv[]) {
    auto config_file = find_config_file(argc, argv);
    if (config_file.is_error()) {
        return Err(config_file.error());
    }

    ClientConfig config = default_client_config();
    if (!config_file.value().empty()) {
        auto loaded = load_client_config(config_file.value());
        if (loaded.is_error()) {
            return Err(loaded.error());
        }
        config = std::move(loaded.value());
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "-c" || arg == "--config") {
            ++i;
        } else if (arg == "--server" && has_value) {
            config.server_url = argv[++i];
        } else if (arg == "--storage" && has_value) {
            config.storage_dir = argv[++i];
        } else if ((arg == "-d" || arg == "--data") && has_value) {
            config.save_directory = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.log_level = "debug";
        } else {
            return Err("Unknown or incomplete option: " + arg);
        }
    }
    return Ok(std::move(config));
}

} // namespace taildrive
