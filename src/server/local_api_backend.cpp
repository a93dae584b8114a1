#include "taildrive/server/local_api_backend.hpp"
#include "taildrive/network/url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace taildrive::server {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {

constexpr std::size_t kMaxErrorBodyChars = 200;

std::string truncate(const std::string& text) {
    if (text.size() <= kMaxErrorBodyChars) {
        return text;
    }
    return text.substr(0, kMaxErrorBodyChars) + "...";
}

BackendError make_backend_error(BackendError::Kind kind, std::string message) {
    BackendError error;
    error.kind = kind;
    error.message = std::move(message);
    return error;
}

model::PeerInfo peer_from_status(const json& node, bool is_self) {
    model::PeerInfo peer;
    peer.id = node.value("ID", "");
    peer.hostname = node.value("HostName", "");
    peer.dns_name = node.value("DNSName", "");
    if (node.contains("TailscaleIPs") && node["TailscaleIPs"].is_array()) {
        peer.ip_addresses = node["TailscaleIPs"].get<std::vector<std::string>>();
    }
    peer.online = is_self ? true : node.value("Online", false);
    if (node.contains("OS") && node["OS"].is_string()) {
        peer.os = node["OS"].get<std::string>();
    }
    peer.is_self = is_self;
    return peer;
}

} // namespace

std::vector<model::PeerInfo> parse_daemon_status(const json& status) {
    std::vector<model::PeerInfo> peers;

    if (status.contains("Self") && status["Self"].is_object()) {
        peers.push_back(peer_from_status(status["Self"], true));
    }

    if (status.contains("Peer") && status["Peer"].is_object()) {
        for (const auto& [key, node] : status["Peer"].items()) {
            auto peer = peer_from_status(node, false);
            if (!peer.os.empty()) {
                peers.push_back(std::move(peer));
            }
        }
    }

    std::stable_sort(peers.begin(), peers.end(), [](const model::PeerInfo& a, const model::PeerInfo& b) {
        if (a.online != b.online) {
            return a.online;
        }
        return a.hostname < b.hostname;
    });
    return peers;
}

std::vector<model::InboundFile> parse_bus_notification(const json& notification) {
    std::vector<model::InboundFile> files;

    const auto incoming = notification.find("IncomingFiles");
    if (incoming != notification.end() && incoming->is_array()) {
        for (const auto& entry : *incoming) {
            if (!entry.value("Done", false)) {
                continue;
            }
            const auto final_path = entry.find("FinalPath");
            if (final_path == entry.end() || !final_path->is_string() ||
                final_path->get<std::string>().empty()) {
                continue;
            }
            model::InboundFile file;
            file.name = entry.value("Name", "");
            file.final_path = final_path->get<std::string>();
            file.size = entry.value("DeclaredSize", uint64_t{0});
            if (!file.name.empty()) {
                files.push_back(std::move(file));
            }
        }
    }

    const auto waiting = notification.find("FilesWaiting");
    if (waiting != notification.end() && waiting->is_object()) {
        for (const auto& [sender, entries] : waiting->items()) {
            if (!entries.is_array()) {
                continue;
            }
            for (const auto& entry : entries) {
                model::InboundFile file;
                file.name = entry.value("Name", "");
                file.size = entry.value("Size", uint64_t{0});
                file.from_peer = sender;
                if (!file.name.empty()) {
                    files.push_back(std::move(file));
                }
            }
        }
    }

    return files;
}

LocalApiBackend::LocalApiBackend(std::shared_ptr<network::HttpTransport> transport)
    : transport_(std::move(transport)) {
}

BackendResult<HttpResponse> LocalApiBackend::call(const HttpRequest& request) {
    auto result = transport_->round_trip(request);
    if (result.is_error()) {
        return Err(make_backend_error(BackendError::Kind::Unavailable, result.error()));
    }

    HttpResponse& response = result.value();
    if (response.status_code == 404) {
        return Err(make_backend_error(BackendError::Kind::NotFound,
                                      request.path() + ": " + truncate(response.body_as_string())));
    }
    if (!response.is_success()) {
        return Err(make_backend_error(BackendError::Kind::Rejected,
                                      "status " + std::to_string(response.status_code) + ": " +
                                          truncate(response.body_as_string())));
    }
    return Ok(std::move(response));
}

BackendResult<json> LocalApiBackend::call_json(const HttpRequest& request) {
    auto response = call(request);
    if (response.is_error()) {
        return Err(response.error());
    }
    json doc = json::parse(response.value().body_as_string(), nullptr, false);
    if (doc.is_discarded()) {
        return Err(make_backend_error(BackendError::Kind::Malformed,
                                      "invalid JSON from " + request.path()));
    }
    return Ok(std::move(doc));
}

BackendResult<std::vector<model::PeerInfo>> LocalApiBackend::list_peers() {
    auto status = call_json(HttpRequest(HttpMethod::GET, "/localapi/v0/status"));
    if (status.is_error()) {
        return Err(status.error());
    }
    try {
        return Ok(parse_daemon_status(status.value()));
    } catch (const json::exception& e) {
        return Err(make_backend_error(BackendError::Kind::Malformed,
                                      std::string("status document: ") + e.what()));
    }
}

BackendResult<std::vector<model::WaitingFile>> LocalApiBackend::list_inbox() {
    auto listing = call_json(HttpRequest(HttpMethod::GET, "/localapi/v0/files/"));
    if (listing.is_error()) {
        return Err(listing.error());
    }

    std::vector<model::WaitingFile> files;
    const json& doc = listing.value();
    if (doc.is_null()) {
        return Ok(std::move(files));
    }
    if (!doc.is_array()) {
        return Err(make_backend_error(BackendError::Kind::Malformed, "inbox listing is not an array"));
    }
    try {
        for (const auto& entry : doc) {
            model::WaitingFile file;
            file.name = entry.at("Name").get<std::string>();
            file.size = entry.value("Size", uint64_t{0});
            files.push_back(std::move(file));
        }
    } catch (const json::exception& e) {
        return Err(make_backend_error(BackendError::Kind::Malformed,
                                      std::string("inbox entry: ") + e.what()));
    }
    return Ok(std::move(files));
}

BackendResult<std::vector<uint8_t>> LocalApiBackend::download_inbox(const std::string& name) {
    auto response = call(HttpRequest(HttpMethod::GET, "/localapi/v0/files/" + network::url_encode(name)));
    if (response.is_error()) {
        return Err(response.error());
    }
    return Ok(std::move(response.value().body));
}

BackendResult<void> LocalApiBackend::delete_inbox(const std::string& name) {
    auto response = call(HttpRequest(HttpMethod::DELETE_METHOD,
                                     "/localapi/v0/files/" + network::url_encode(name)));
    if (response.is_error()) {
        return Err(response.error());
    }
    return Ok();
}

BackendResult<void> LocalApiBackend::push_file(const std::string& peer_id,
                                               const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err(make_backend_error(BackendError::Kind::NotFound,
                                      "not a regular file: " + path.string()));
    }

    std::string name = path.filename().string();
    if (name.empty()) {
        name = "file";
    }

    HttpRequest request(HttpMethod::PUT,
                        "/localapi/v0/file-put/" + network::url_encode(peer_id) +
                            network::build_query({{"name", name}}));
    request.set_header("Content-Type", "application/octet-stream");
    request.body_file = path;

    auto response = call(request);
    if (response.is_error()) {
        return Err(response.error());
    }
    spdlog::info("Pushed {} to peer {}", name, peer_id);
    return Ok();
}

BackendResult<void> LocalApiBackend::watch_inbound(const InboundCallback& on_file,
                                                   const std::function<bool()>& keep_running) {
    LineBuffer lines;
    auto on_line = [&on_file](const std::string& line) {
        json notification = json::parse(line, nullptr, false);
        if (notification.is_discarded() || !notification.is_object()) {
            spdlog::warn("Skipping malformed event-bus line ({} bytes)", line.size());
            return;
        }
        try {
            for (const auto& file : parse_bus_notification(notification)) {
                on_file(file);
            }
        } catch (const json::exception& e) {
            spdlog::warn("Skipping event-bus notification: {}", e.what());
        }
    };

    auto result = transport_->stream(
        HttpRequest(HttpMethod::GET, "/localapi/v0/watch-ipn-bus"),
        [&](const char* data, std::size_t len) {
            lines.append(data, len, on_line);
            return keep_running();
        },
        keep_running);

    if (result.is_error()) {
        return Err(make_backend_error(BackendError::Kind::Unavailable, result.error()));
    }
    const HttpResponse& response = result.value();
    if (!response.is_success()) {
        return Err(make_backend_error(
            response.status_code == 404 ? BackendError::Kind::NotFound : BackendError::Kind::Rejected,
            "event bus answered " + std::to_string(response.status_code)));
    }
    return Ok();
}

} // namespace taildrive::server
