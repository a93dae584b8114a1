#include "taildrive/client/remote_api.hpp"
#include "taildrive/model/json.hpp"
#include "taildrive/network/url.hpp"

#include <nlohmann/json.hpp>

namespace taildrive::client {

namespace fs = std::filesystem;
using json = nlohmann::json;
using network::HttpMethod;
using network::HttpMethodUtils;
using network::HttpRequest;
using network::HttpResponse;

namespace {

std::string describe_failure(const HttpRequest& request, const HttpResponse& response) {
    std::string detail = response.body_as_string();
    json body = json::parse(detail, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
        detail = body["error"].get<std::string>();
    }
    return HttpMethodUtils::to_string(request.method) + " " + request.path() + ": HTTP " +
           std::to_string(response.status_code) + (detail.empty() ? "" : " " + detail);
}

HttpRequest json_request(HttpMethod method, const std::string& target, const json& body) {
    HttpRequest request(method, target);
    request.set_header("Content-Type", "application/json");
    request.set_body(body.dump());
    return request;
}

} // namespace

RemoteApi::RemoteApi(std::shared_ptr<network::HttpTransport> transport)
    : transport_(std::move(transport)) {
}

Result<HttpResponse> RemoteApi::send(const HttpRequest& request) {
    auto result = transport_->round_trip(request);
    if (result.is_error()) {
        return Err(result.error());
    }
    if (!result.value().is_success()) {
        return Err(describe_failure(request, result.value()));
    }
    return Ok(std::move(result.value()));
}

Result<json> RemoteApi::send_json(const HttpRequest& request) {
    auto response = send(request);
    if (response.is_error()) {
        return Err(response.error());
    }
    json doc = json::parse(response.value().body_as_string(), nullptr, false);
    if (doc.is_discarded()) {
        return Err("Invalid JSON from " + request.path());
    }
    return Ok(std::move(doc));
}

template<typename T>
Result<T> RemoteApi::get_json(const std::string& target) {
    HttpRequest request(HttpMethod::GET, target);
    auto doc = send_json(request);
    if (doc.is_error()) {
        return Err(doc.error());
    }
    try {
        return Ok(doc.value().get<T>());
    } catch (const json::exception& e) {
        return Err("Unexpected JSON from " + request.path() + ": " + e.what());
    }
}

Result<model::StatusSnapshot> RemoteApi::status() {
    auto doc = send_json(HttpRequest(HttpMethod::GET, "/status"));
    if (doc.is_error()) {
        return Err(doc.error());
    }
    try {
        return Ok(model::status_from_json(doc.value()));
    } catch (const json::exception& e) {
        return Err(std::string("Unexpected JSON from /status: ") + e.what());
    }
}

Result<std::vector<model::WaitingFile>> RemoteApi::files() {
    auto doc = send_json(HttpRequest(HttpMethod::GET, "/files"));
    if (doc.is_error()) {
        return Err(doc.error());
    }
    try {
        return Ok(doc.value().at("files").get<std::vector<model::WaitingFile>>());
    } catch (const json::exception& e) {
        return Err(std::string("Unexpected JSON from /files: ") + e.what());
    }
}

Result<model::DownloadedFile> RemoteApi::fetch_file(const std::string& target, const std::string& fallback_name) {
    auto response = send(HttpRequest(HttpMethod::GET, target));
    if (response.is_error()) {
        return Err(response.error());
    }

    model::DownloadedFile file;
    file.filename = network::content_disposition_filename(response.value().get_header("Content-Disposition"));
    if (file.filename.empty()) {
        file.filename = fallback_name;
    }
    file.data = std::move(response.value().body);
    return Ok(std::move(file));
}

Result<model::DownloadedFile> RemoteApi::download(const std::string& name) {
    return fetch_file("/download/" + network::url_encode(name), name);
}

Result<model::DownloadedFile> RemoteApi::download_last() {
    return fetch_file("/download", "download");
}

Result<std::vector<model::RemoteFile>> RemoteApi::browse(const std::optional<std::string>& path) {
    std::string target = "/browse";
    if (path && !path->empty()) {
        target += network::build_query({{"path", *path}});
    }
    return get_json<std::vector<model::RemoteFile>>(target);
}

Result<model::DownloadedFile> RemoteApi::pull(const std::string& desktop_path) {
    std::string fallback = fs::path(desktop_path).filename().string();
    if (fallback.empty()) {
        fallback = "download";
    }
    return fetch_file("/pull" + network::build_query({{"path", desktop_path}}), fallback);
}

Result<void> RemoteApi::upload(const fs::path& local_file, const std::string& remote_name) {
    std::string name = remote_name;
    while (!name.empty() && name.front() == '/') {
        name.erase(0, 1);
    }
    if (name.empty()) {
        return Err(std::string("Upload needs a destination name"));
    }

    HttpRequest request(HttpMethod::PUT, "/upload/" + network::url_encode_path(name));
    request.set_header("Content-Type", "application/octet-stream");
    request.body_file = local_file;
    auto response = send(request);
    if (response.is_error()) {
        return Err(response.error());
    }
    return Ok();
}

Result<void> RemoteApi::sync_upload(const fs::path& local_file,
                                    const std::string& desktop_path,
                                    std::optional<uint64_t> mtime) {
    std::string target = mtime
        ? "/sync/upload" + network::build_query({{"path", desktop_path}, {"mtime", std::to_string(*mtime)}})
        : "/sync/upload" + network::build_query({{"path", desktop_path}});

    HttpRequest request(HttpMethod::PUT, target);
    request.set_header("Content-Type", "application/octet-stream");
    request.body_file = local_file;
    auto response = send(request);
    if (response.is_error()) {
        return Err(response.error());
    }
    return Ok();
}

Result<std::vector<model::PeerInfo>> RemoteApi::peers() {
    return get_json<std::vector<model::PeerInfo>>("/peers");
}

Result<std::vector<model::SyncProject>> RemoteApi::projects() {
    return get_json<std::vector<model::SyncProject>>("/sync/projects");
}

Result<model::SyncProject> RemoteApi::create_project(const std::string& mobile_path,
                                                     const std::string& desktop_path) {
    const json body{{"local_path", desktop_path}, {"remote_path", mobile_path}};
    auto doc = send_json(json_request(HttpMethod::POST, "/sync/projects", body));
    if (doc.is_error()) {
        return Err(doc.error());
    }
    try {
        return Ok(doc.value().get<model::SyncProject>());
    } catch (const json::exception& e) {
        return Err(std::string("Unexpected JSON from /sync/projects: ") + e.what());
    }
}

Result<void> RemoteApi::delete_project(const std::string& id) {
    auto response = send(HttpRequest(HttpMethod::DELETE_METHOD, "/sync/projects/" + network::url_encode(id)));
    if (response.is_error()) {
        return Err(response.error());
    }
    return Ok();
}

Result<std::vector<model::SyncChange>> RemoteApi::check() {
    return get_json<std::vector<model::SyncChange>>("/sync/check");
}

Result<void> RemoteApi::ack(const std::string& id, uint64_t timestamp) {
    const json body{{"id", id}, {"timestamp", timestamp}};
    auto response = send(json_request(HttpMethod::POST, "/sync/ack", body));
    if (response.is_error()) {
        return Err(response.error());
    }
    return Ok();
}

} // namespace taildrive::client
