#pragma once

#include "taildrive/network/http_router.hpp"
#include "taildrive/server/file_sender.hpp"
#include "taildrive/server/state.hpp"
#include "taildrive/server/sync_project_table.hpp"
#include "taildrive/server/transfer_backend.hpp"

#include <filesystem>

namespace taildrive::server {

/**
 * @brief The desktop's HTTP surface: status, inbox, browsing, transfers, sync
 *
 * Handlers take each table lock only long enough to read or mutate it; no
 * lock is held across backend or filesystem I/O except the sync-project
 * table's own persistence.
 *
 * Errors are answered as `{"error": "..."}` with the matching status.
 */
class StatusService {
public:
    struct Options {
        std::filesystem::path upload_root;      ///< Root for PUT /upload/{path}
        std::filesystem::path browse_default;   ///< GET /browse without ?path=
    };

    StatusService(ServerState& state,
                  SyncProjectTable& projects,
                  TransferBackend& backend,
                  FileSender& sender,
                  Options options);

    /**
     * @brief Register every route, the request-log middleware and a JSON 404
     */
    void register_routes(network::HttpRouter& router);

private:
    network::HttpResponse handle_status(const network::HttpContext& ctx);
    network::HttpResponse handle_list_files(const network::HttpContext& ctx);
    network::HttpResponse handle_download(const network::HttpContext& ctx);
    network::HttpResponse handle_download_last(const network::HttpContext& ctx);
    network::HttpResponse handle_delete_file(const network::HttpContext& ctx);
    network::HttpResponse handle_browse(const network::HttpContext& ctx);
    network::HttpResponse handle_pull(const network::HttpContext& ctx);
    network::HttpResponse handle_upload(const network::HttpContext& ctx);
    network::HttpResponse handle_sync_upload(const network::HttpContext& ctx);
    network::HttpResponse handle_peers(const network::HttpContext& ctx);
    network::HttpResponse handle_list_projects(const network::HttpContext& ctx);
    network::HttpResponse handle_create_project(const network::HttpContext& ctx);
    network::HttpResponse handle_delete_project(const network::HttpContext& ctx);
    network::HttpResponse handle_set_paused(const network::HttpContext& ctx, bool paused);
    network::HttpResponse handle_check(const network::HttpContext& ctx);
    network::HttpResponse handle_ack(const network::HttpContext& ctx);
    network::HttpResponse handle_send(const network::HttpContext& ctx);

    network::HttpResponse serve_inbox_file(const std::string& name);

    ServerState& state_;
    SyncProjectTable& projects_;
    TransferBackend& backend_;
    FileSender& sender_;
    Options options_;
};

} // namespace taildrive::server
