#pragma once

#include "taildrive/network/http_client.hpp"
#include "taildrive/server/transfer_backend.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace taildrive::server {

constexpr const char* kDefaultLocalApiSocket = "/var/run/tailscale/tailscaled.sock";
constexpr const char* kLocalApiHost = "local-tailscaled.sock";

/**
 * @brief Splits a byte stream into newline-terminated lines
 *
 * Bytes after the last newline stay buffered until the next append.
 * A trailing '\r' is stripped and blank lines are skipped.
 */
class LineBuffer {
public:
    template<typename OnLine>
    void append(const char* data, std::size_t len, OnLine&& on_line) {
        buffer_.append(data, len);
        std::size_t start = 0;
        for (auto newline = buffer_.find('\n'); newline != std::string::npos;
             newline = buffer_.find('\n', start)) {
            std::string line = buffer_.substr(start, newline - start);
            start = newline + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") != std::string::npos) {
                on_line(line);
            }
        }
        buffer_.erase(0, start);
    }

    std::size_t pending() const { return buffer_.size(); }

    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
};

/**
 * @brief Decode the daemon's status document into peers
 *
 * The self node is always kept and forced online; other peers are kept only
 * when they report an OS. Online peers sort first, then by hostname.
 */
std::vector<model::PeerInfo> parse_daemon_status(const nlohmann::json& status);

/**
 * @brief Extract inbound files from one event-bus notification
 *
 * `IncomingFiles` entries that are done and carry a `FinalPath` yield a file
 * with a path; `FilesWaiting` entries yield files without one, tagged with
 * the sending node. Transfers still in progress yield nothing.
 */
std::vector<model::InboundFile> parse_bus_notification(const nlohmann::json& notification);

/**
 * @brief TransferBackend over the daemon's local HTTP API
 *
 * The transport normally points at the daemon's Unix-domain socket with
 * Host `local-tailscaled.sock`.
 */
class LocalApiBackend : public TransferBackend {
public:
    explicit LocalApiBackend(std::shared_ptr<network::HttpTransport> transport);

    BackendResult<std::vector<model::PeerInfo>> list_peers() override;
    BackendResult<std::vector<model::WaitingFile>> list_inbox() override;
    BackendResult<std::vector<uint8_t>> download_inbox(const std::string& name) override;
    BackendResult<void> delete_inbox(const std::string& name) override;
    BackendResult<void> push_file(const std::string& peer_id,
                                  const std::filesystem::path& path) override;
    BackendResult<void> watch_inbound(const InboundCallback& on_file,
                                      const std::function<bool()>& keep_running) override;

private:
    // Transport failures become Unavailable; non-2xx become NotFound/Rejected
    BackendResult<network::HttpResponse> call(const network::HttpRequest& request);

    BackendResult<nlohmann::json> call_json(const network::HttpRequest& request);

    std::shared_ptr<network::HttpTransport> transport_;
};

} // namespace taildrive::server
