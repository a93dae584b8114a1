/**
 * @file mobile_client.cpp
 * @brief Mobile node as a terminal program
 *
 * Runs the sync worker against a desktop node and reads simple commands
 * from stdin. Status changes, transfers and notifications are printed as
 * they arrive.
 *
 * Run with:
 *   ./build/taildrive-mobile --server http://desktop:8080 --data ~/Downloads
 *
 * Commands:
 *   status | peers | files | projects
 *   refresh
 *   download NAME | last
 *   browse [DIR] | pull PATH
 *   upload FILE [REMOTE_NAME]
 *   sync add MOBILE_PATH DESKTOP_PATH | sync rm ID
 *   connect URL
 *   quit
 */

#include "taildrive/client/channel.hpp"
#include "taildrive/client/sync_client.hpp"
#include "taildrive/core/config.hpp"
#include "taildrive/core/file_util.hpp"
#include "taildrive/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>

using namespace taildrive;
using namespace taildrive::client;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "      --server URL      Desktop node (default http://127.0.0.1:8080)\n"
              << "      --storage DIR     Peer cache and project mirror\n"
              << "  -d, --data DIR        Save directory for downloads\n"
              << "  -v, --verbose         Debug logging\n";
}

void print_status(const ClientState& state) {
    std::cout << state.status_message << " (" << state.server_url << ")\n";
    if (state.last_sent) {
        std::cout << "  Last sent:     " << state.last_sent->name << " ("
                  << format_size(state.last_sent->size) << ", "
                  << format_timestamp(state.last_sent->timestamp, unix_now()) << ", "
                  << (state.last_sent->sending ? "sending" : state.last_sent->succeeded ? "done" : "failed")
                  << ")\n";
    }
    if (state.last_received_file) {
        std::cout << "  Last received: " << *state.last_received_file << "\n";
    }
    if (state.download_status) {
        std::cout << "  " << *state.download_status << "\n";
    }
    if (state.sync_status) {
        std::cout << "  " << *state.sync_status << "\n";
    }
}

void print_peers(const ClientState& state) {
    for (const auto& peer : state.peers) {
        std::cout << (peer.online ? "  ● " : "  ○ ") << peer.hostname
                  << "  " << peer.os << "  " << peer.id << "\n";
    }
    if (state.peers.empty()) {
        std::cout << "  (no peers)\n";
    }
}

void print_files(const ClientState& state) {
    for (const auto& file : state.waiting_files) {
        std::cout << "  " << file.name << "  " << format_size(file.size) << "\n";
    }
    if (state.waiting_files.empty()) {
        std::cout << "  (inbox empty)\n";
    }
}

void print_listing(const ClientState& state) {
    if (state.browse_status) {
        std::cout << *state.browse_status << "\n";
    }
    for (const auto& entry : state.remote_files) {
        std::cout << (entry.is_dir ? "  [dir] " : "        ") << entry.name;
        if (!entry.is_dir) {
            std::cout << "  " << format_size(static_cast<uint64_t>(entry.size));
        }
        std::cout << "\n";
    }
}

void print_projects(const ClientState& state) {
    for (const auto& project : state.projects) {
        std::cout << "  " << project.id << "  " << project.remote_path << " <-> " << project.local_path
                  << (project.paused ? "  (paused)" : "") << "\n";
    }
    if (state.projects.empty()) {
        std::cout << "  (no sync projects)\n";
    }
}

// Returns false when the user asked to quit
bool run_command(SyncClient& client, const std::string& line) {
    std::istringstream in(line);
    std::string verb;
    in >> verb;

    const ClientState& state = client.state();
    if (verb.empty()) {
        return true;
    }
    if (verb == "quit" || verb == "exit") {
        return false;
    }
    if (verb == "status") {
        print_status(state);
    } else if (verb == "peers") {
        print_peers(state);
    } else if (verb == "files") {
        print_files(state);
    } else if (verb == "projects") {
        print_projects(state);
    } else if (verb == "refresh") {
        client.refresh();
    } else if (verb == "download") {
        std::string name;
        std::getline(in >> std::ws, name);
        client.download_file(name);
    } else if (verb == "last") {
        client.download_last();
    } else if (verb == "browse") {
        std::string dir;
        std::getline(in >> std::ws, dir);
        client.browse(dir.empty() ? std::nullopt : std::optional<std::string>(dir));
    } else if (verb == "pull") {
        std::string path;
        std::getline(in >> std::ws, path);
        client.pull_file(path);
    } else if (verb == "upload") {
        std::string file;
        std::string remote;
        in >> file >> remote;
        client.upload_file(file, remote.empty() ? std::nullopt : std::optional<std::string>(remote));
    } else if (verb == "sync") {
        std::string action;
        in >> action;
        if (action == "add") {
            std::string mobile_path;
            std::string desktop_path;
            in >> mobile_path >> desktop_path;
            client.create_sync_project(mobile_path, desktop_path);
        } else if (action == "rm") {
            std::string id;
            in >> id;
            client.delete_sync_project(id);
        } else {
            client.fetch_sync_projects();
        }
    } else if (verb == "connect") {
        std::string url;
        in >> url;
        auto reconnected = client.reconnect(url);
        if (reconnected.is_error()) {
            std::cout << "✗ " << reconnected.error() << "\n";
        }
    } else {
        std::cout << "Unknown command '" << verb << "'\n";
    }
    return true;
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

    auto parsed = parse_client_args(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    const ClientConfig config = parsed.value();

    auto logging = init_logging(config.log_level, config.log_file);
    if (logging.is_error()) {
        std::cerr << logging.error() << "\n";
        return 2;
    }

    SyncClient client(config);
    auto started = client.start();
    if (started.is_error()) {
        spdlog::error("{}", started.error());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // stdin is read on its own thread so the event loop never blocks on it
    auto lines = std::make_shared<Channel<std::string>>();
    std::thread reader([lines]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!lines->push(line)) {
                return;
            }
        }
        lines->close();
    });
    reader.detach();

    bool was_connected = false;
    std::optional<std::string> shown_download;
    std::optional<std::string> shown_browse;
    std::optional<std::string> shown_sync;
    auto show_if_changed = [](const std::optional<std::string>& current, std::optional<std::string>& shown) {
        if (current && current != shown) {
            std::cout << *current << "\n";
        }
        shown = current;
    };
    while (!g_shutdown) {
        if (auto line = lines->pop_for(std::chrono::milliseconds(100))) {
            if (!run_command(client, *line)) {
                break;
            }
        } else if (lines->is_closed()) {
            // Headless: keep syncing until a signal arrives
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (client.process_events() == 0) {
            continue;
        }

        const ClientState& state = client.state();
        if (state.connected != was_connected) {
            std::cout << state.status_message << "\n";
            was_connected = state.connected;
        }
        show_if_changed(state.download_status, shown_download);
        show_if_changed(state.browse_status, shown_browse);
        show_if_changed(state.sync_status, shown_sync);
        while (client.notifications().has_pending()) {
            const std::string title = client.notifications().front_title();
            std::cout << "[" << title << "] " << client.notifications().consume_body() << "\n";
        }
        while (client.has_pending_share()) {
            std::cout << "Saved to " << client.consume_pending_share_path() << "\n";
        }
    }

    lines->close();
    client.stop();
    return 0;
}
