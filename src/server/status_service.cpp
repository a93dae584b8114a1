#include "taildrive/server/status_service.hpp"
#include "taildrive/core/file_util.hpp"
#include "taildrive/model/json.hpp"
#include "taildrive/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace taildrive::server {

namespace fs = std::filesystem;
using json = nlohmann::json;
using network::HttpContext;
using network::HttpMethodUtils;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump(2));
    return response;
}

HttpResponse make_error(HttpStatus status, const std::string& message) {
    return make_json_response(status, json{{"error", message}});
}

HttpResponse make_backend_error(const BackendError& error) {
    const auto status = error.kind == BackendError::Kind::NotFound ? HttpStatus::NOT_FOUND
                                                                   : HttpStatus::BAD_GATEWAY;
    return make_error(status, error.describe());
}

HttpResponse make_table_error(const TableError& error) {
    switch (error.kind) {
        case TableError::Kind::NotFound:
            return make_error(HttpStatus::NOT_FOUND, error.message);
        case TableError::Kind::InvalidArgument:
            return make_error(HttpStatus::BAD_REQUEST, error.message);
        case TableError::Kind::Storage:
            break;
    }
    spdlog::error("Sync project store: {}", error.message);
    return make_error(HttpStatus::INTERNAL_SERVER_ERROR, error.message);
}

HttpResponse make_attachment(const std::string& filename) {
    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Content-Disposition", network::content_disposition_attachment(filename));
    return response;
}

bool parse_unsigned(const std::string& text, uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

json parse_body(const HttpContext& ctx) {
    return json::parse(ctx.request.body_as_string(), nullptr, false);
}

bool has_string(const json& doc, const char* key) {
    return doc.contains(key) && doc[key].is_string() && !doc[key].get<std::string>().empty();
}

bool escapes_root(const fs::path& relative) {
    for (const auto& part : relative) {
        if (part.string() == "..") {
            return true;
        }
    }
    return false;
}

} // namespace

StatusService::StatusService(ServerState& state,
                             SyncProjectTable& projects,
                             TransferBackend& backend,
                             FileSender& sender,
                             Options options)
    : state_(state)
    , projects_(projects)
    , backend_(backend)
    , sender_(sender)
    , options_(std::move(options)) {
}

void StatusService::register_routes(network::HttpRouter& router) {
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.target);
        return true;
    });

    router.set_not_found_handler([](const HttpContext& ctx) {
        return make_error(HttpStatus::NOT_FOUND, "No route for " + ctx.request.path());
    });

    router.get("/status", [this](const HttpContext& ctx) { return handle_status(ctx); });
    router.get("/files", [this](const HttpContext& ctx) { return handle_list_files(ctx); });
    router.delete_("/files/:name", [this](const HttpContext& ctx) { return handle_delete_file(ctx); });
    router.get("/download", [this](const HttpContext& ctx) { return handle_download_last(ctx); });
    router.get("/download/:name", [this](const HttpContext& ctx) { return handle_download(ctx); });
    router.get("/browse", [this](const HttpContext& ctx) { return handle_browse(ctx); });
    router.get("/pull", [this](const HttpContext& ctx) { return handle_pull(ctx); });
    router.put("/upload/*path", [this](const HttpContext& ctx) { return handle_upload(ctx); });
    router.put("/sync/upload", [this](const HttpContext& ctx) { return handle_sync_upload(ctx); });
    router.get("/peers", [this](const HttpContext& ctx) { return handle_peers(ctx); });
    router.get("/sync/projects", [this](const HttpContext& ctx) { return handle_list_projects(ctx); });
    router.post("/sync/projects", [this](const HttpContext& ctx) { return handle_create_project(ctx); });
    router.delete_("/sync/projects/:id", [this](const HttpContext& ctx) { return handle_delete_project(ctx); });
    router.post("/sync/projects/:id/pause", [this](const HttpContext& ctx) { return handle_set_paused(ctx, true); });
    router.post("/sync/projects/:id/resume", [this](const HttpContext& ctx) { return handle_set_paused(ctx, false); });
    router.get("/sync/check", [this](const HttpContext& ctx) { return handle_check(ctx); });
    router.post("/sync/ack", [this](const HttpContext& ctx) { return handle_ack(ctx); });
    router.post("/send", [this](const HttpContext& ctx) { return handle_send(ctx); });
}

// ────────────────────────────────────────────────────────────
// Status and inbox
// ────────────────────────────────────────────────────────────

HttpResponse StatusService::handle_status(const HttpContext&) {
    model::StatusSnapshot snapshot;
    snapshot.last_sent = state_.sent.get();
    snapshot.last_received_file = state_.received.last_file();

    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    if (!ec) {
        snapshot.server_cwd = cwd.string();
    }
    return make_json_response(HttpStatus::OK, model::status_to_json(snapshot));
}

HttpResponse StatusService::handle_list_files(const HttpContext&) {
    auto files = backend_.list_inbox();
    if (files.is_error()) {
        spdlog::warn("Listing inbox failed: {}", files.error().describe());
        return make_backend_error(files.error());
    }
    return make_json_response(HttpStatus::OK, json{{"files", files.value()}});
}

HttpResponse StatusService::serve_inbox_file(const std::string& name) {
    if (const auto path = state_.received.path_for(name)) {
        std::error_code ec;
        const auto size = fs::file_size(*path, ec);
        if (!ec && fs::is_regular_file(*path, ec)) {
            auto response = make_attachment(name);
            response.set_body_file(*path, size);
            return response;
        }
        spdlog::debug("Cached path {} for {} is gone, asking the daemon", *path, name);
    }

    auto content = backend_.download_inbox(name);
    if (content.is_error()) {
        return make_error(HttpStatus::NOT_FOUND,
                          "File '" + name + "' not available: " + content.error().describe());
    }
    auto response = make_attachment(name);
    response.set_body(std::move(content.value()));
    return response;
}

HttpResponse StatusService::handle_download(const HttpContext& ctx) {
    return serve_inbox_file(ctx.get_param("name"));
}

HttpResponse StatusService::handle_download_last(const HttpContext&) {
    const auto last = state_.received.last_file();
    if (!last) {
        return make_error(HttpStatus::NOT_FOUND, "No file received yet");
    }
    return serve_inbox_file(*last);
}

HttpResponse StatusService::handle_delete_file(const HttpContext& ctx) {
    const std::string name = ctx.get_param("name");
    auto deleted = backend_.delete_inbox(name);
    if (deleted.is_error()) {
        return make_backend_error(deleted.error());
    }
    state_.received.forget(name);
    return make_json_response(HttpStatus::OK, json{{"deleted", name}});
}

// ────────────────────────────────────────────────────────────
// Filesystem access
// ────────────────────────────────────────────────────────────

HttpResponse StatusService::handle_browse(const HttpContext& ctx) {
    const fs::path dir = ctx.has_query("path") && !ctx.get_query("path").empty()
                             ? fs::path(ctx.get_query("path"))
                             : options_.browse_default;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return make_error(HttpStatus::NOT_FOUND, "Not a directory: " + dir.string());
    }

    std::vector<model::RemoteFile> entries;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return make_error(HttpStatus::INTERNAL_SERVER_ERROR,
                          "Cannot read " + dir.string() + ": " + ec.message());
    }
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }

        model::RemoteFile entry;
        entry.name = name;
        std::error_code entry_ec;
        entry.is_dir = it->is_directory(entry_ec);
        if (!entry.is_dir) {
            const auto size = it->file_size(entry_ec);
            entry.size = entry_ec ? 0 : static_cast<int64_t>(size);
        }
        auto modified = path_mtime(it->path());
        entry.modified = modified.value_or(0);
        entries.push_back(std::move(entry));
    }

    if (ec) {
        return make_error(HttpStatus::INTERNAL_SERVER_ERROR,
                          "Cannot read " + dir.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const model::RemoteFile& a, const model::RemoteFile& b) { return a.name < b.name; });
    return make_json_response(HttpStatus::OK, json(entries));
}

HttpResponse StatusService::handle_pull(const HttpContext& ctx) {
    const std::string path_arg = ctx.get_query("path");
    if (path_arg.empty()) {
        return make_error(HttpStatus::BAD_REQUEST, "Missing 'path' query parameter");
    }

    const fs::path path(path_arg);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error(HttpStatus::NOT_FOUND, "Not a regular file: " + path_arg);
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return make_error(HttpStatus::NOT_FOUND, "Cannot stat " + path_arg + ": " + ec.message());
    }

    auto response = make_attachment(path.filename().string());
    response.set_body_file(path, size);
    return response;
}

HttpResponse StatusService::handle_upload(const HttpContext& ctx) {
    const fs::path relative = fs::path(ctx.get_param("path")).relative_path();
    if (relative.empty() || !relative.has_filename()) {
        return make_error(HttpStatus::BAD_REQUEST, "Upload path must name a file");
    }
    if (escapes_root(relative)) {
        return make_error(HttpStatus::BAD_REQUEST, "Upload path may not contain '..'");
    }

    const fs::path target = options_.upload_root / relative;
    auto written = write_file(target, ctx.request.body);
    if (written.is_error()) {
        spdlog::error("Upload to {} failed: {}", target.string(), written.error());
        return make_error(HttpStatus::INTERNAL_SERVER_ERROR, written.error());
    }

    spdlog::info("Stored upload {} ({} bytes)", target.string(), ctx.request.body.size());
    return make_json_response(HttpStatus::OK, json{{"path", target.string()},
                                                   {"size", ctx.request.body.size()}});
}

HttpResponse StatusService::handle_sync_upload(const HttpContext& ctx) {
    const std::string path_arg = ctx.get_query("path");
    if (path_arg.empty()) {
        return make_error(HttpStatus::BAD_REQUEST, "Missing 'path' query parameter");
    }
    const fs::path target(path_arg);
    if (!target.is_absolute() || !target.has_filename()) {
        return make_error(HttpStatus::BAD_REQUEST, "Sync upload path must be an absolute file path");
    }

    uint64_t mtime = 0;
    const bool has_mtime = ctx.has_query("mtime");
    if (has_mtime && !parse_unsigned(ctx.get_query("mtime"), mtime)) {
        return make_error(HttpStatus::BAD_REQUEST, "Invalid 'mtime': " + ctx.get_query("mtime"));
    }

    auto written = write_file(target, ctx.request.body);
    if (written.is_error()) {
        spdlog::error("Sync upload to {} failed: {}", path_arg, written.error());
        return make_error(HttpStatus::INTERNAL_SERVER_ERROR, written.error());
    }
    if (has_mtime) {
        auto stamped = set_file_mtime(target, mtime);
        if (stamped.is_error()) {
            spdlog::warn("{}", stamped.error());
        }
    }

    spdlog::info("Sync upload wrote {} ({} bytes)", path_arg, ctx.request.body.size());
    return make_json_response(HttpStatus::OK, json{{"path", path_arg},
                                                   {"size", ctx.request.body.size()}});
}

// ────────────────────────────────────────────────────────────
// Peers and sending
// ────────────────────────────────────────────────────────────

HttpResponse StatusService::handle_peers(const HttpContext&) {
    return make_json_response(HttpStatus::OK, json(state_.peers.without_self()));
}

HttpResponse StatusService::handle_send(const HttpContext& ctx) {
    const json body = parse_body(ctx);
    if (body.is_discarded() || !body.is_object() ||
        !has_string(body, "peer_id") || !has_string(body, "path")) {
        return make_error(HttpStatus::BAD_REQUEST, "Expected {\"peer_id\": ..., \"path\": ...}");
    }

    const std::string path = body["path"].get<std::string>();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error(HttpStatus::NOT_FOUND, "Not a regular file: " + path);
    }

    auto queued = sender_.send(body["peer_id"].get<std::string>(), path);
    if (queued.is_error()) {
        return make_error(HttpStatus::BAD_REQUEST, queued.error());
    }
    return make_json_response(HttpStatus::ACCEPTED, json(queued.value()));
}

// ────────────────────────────────────────────────────────────
// Sync projects
// ────────────────────────────────────────────────────────────

HttpResponse StatusService::handle_list_projects(const HttpContext&) {
    return make_json_response(HttpStatus::OK, json(projects_.list()));
}

HttpResponse StatusService::handle_create_project(const HttpContext& ctx) {
    const json body = parse_body(ctx);
    if (body.is_discarded() || !body.is_object() ||
        !has_string(body, "local_path") || !has_string(body, "remote_path")) {
        return make_error(HttpStatus::BAD_REQUEST,
                          "Expected {\"local_path\": ..., \"remote_path\": ...}");
    }

    auto created = projects_.create(body["local_path"].get<std::string>(),
                                    body["remote_path"].get<std::string>());
    if (created.is_error()) {
        return make_table_error(created.error());
    }
    return make_json_response(HttpStatus::OK, json(created.value()));
}

HttpResponse StatusService::handle_delete_project(const HttpContext& ctx) {
    const std::string id = ctx.get_param("id");
    auto removed = projects_.remove(id);
    if (removed.is_error()) {
        return make_table_error(removed.error());
    }
    return make_json_response(HttpStatus::OK, json{{"deleted", id}});
}

HttpResponse StatusService::handle_set_paused(const HttpContext& ctx, bool paused) {
    auto updated = projects_.set_paused(ctx.get_param("id"), paused);
    if (updated.is_error()) {
        return make_table_error(updated.error());
    }
    return make_json_response(HttpStatus::OK, json(updated.value()));
}

HttpResponse StatusService::handle_check(const HttpContext&) {
    return make_json_response(HttpStatus::OK, json(projects_.check()));
}

HttpResponse StatusService::handle_ack(const HttpContext& ctx) {
    const json body = parse_body(ctx);
    if (body.is_discarded() || !body.is_object() || !has_string(body, "id") ||
        !body.contains("timestamp") || !body["timestamp"].is_number_integer() ||
        body["timestamp"].get<int64_t>() < 0) {
        return make_error(HttpStatus::BAD_REQUEST, "Expected {\"id\": ..., \"timestamp\": ...}");
    }

    auto acked = projects_.acknowledge(body["id"].get<std::string>(),
                                       body["timestamp"].get<uint64_t>());
    if (acked.is_error()) {
        return make_table_error(acked.error());
    }
    return make_json_response(HttpStatus::OK, json(acked.value()));
}

} // namespace taildrive::server
