#pragma once

#include "taildrive/core/result.hpp"
#include "taildrive/model/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace taildrive::server {

/**
 * @brief Typed failure from the overlay daemon's control API
 */
struct BackendError {
    enum class Kind {
        Unavailable,   ///< Socket missing, connect/read failure, timeout
        NotFound,      ///< The daemon answered 404
        Rejected,      ///< Any other non-2xx answer
        Malformed      ///< The answer could not be decoded
    };

    Kind kind = Kind::Unavailable;
    std::string message;

    static const char* kind_name(Kind kind) {
        switch (kind) {
            case Kind::Unavailable: return "unavailable";
            case Kind::NotFound: return "not found";
            case Kind::Rejected: return "rejected";
            case Kind::Malformed: return "malformed";
        }
        return "unknown";
    }

    std::string describe() const {
        return std::string(kind_name(kind)) + ": " + message;
    }
};

template<typename T>
using BackendResult = Result<T, BackendError>;

using InboundCallback = std::function<void(const model::InboundFile&)>;

/**
 * @brief Everything the desktop node needs from the overlay daemon
 *
 * Implementations are called concurrently from HTTP worker threads, the
 * backend monitor, the inbound watcher and the file sender.
 */
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    /**
     * @brief Self node (forced online) plus every peer reporting an OS
     */
    virtual BackendResult<std::vector<model::PeerInfo>> list_peers() = 0;

    virtual BackendResult<std::vector<model::WaitingFile>> list_inbox() = 0;

    /**
     * @brief Buffered fetch of one inbox file
     */
    virtual BackendResult<std::vector<uint8_t>> download_inbox(const std::string& name) = 0;

    virtual BackendResult<void> delete_inbox(const std::string& name) = 0;

    /**
     * @brief Push a local file into a peer's inbox; blocks until the daemon answers
     */
    virtual BackendResult<void> push_file(const std::string& peer_id,
                                          const std::filesystem::path& path) = 0;

    /**
     * @brief Follow the daemon's event bus until it drops or `keep_running`
     *        returns false
     *
     * `on_file` runs on the reading thread and must not block. The bus does
     * not buffer for slow readers: events missed while the callback is busy
     * are lost.
     */
    virtual BackendResult<void> watch_inbound(const InboundCallback& on_file,
                                              const std::function<bool()>& keep_running) = 0;
};

} // namespace taildrive::server
