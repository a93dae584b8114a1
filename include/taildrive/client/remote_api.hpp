#pragma once

#include "taildrive/core/result.hpp"
#include "taildrive/model/types.hpp"
#include "taildrive/network/http_client.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taildrive::client {

/**
 * @brief Typed calls against the desktop's status/sync service
 *
 * Each method is one HTTP exchange. Transport failures and non-2xx answers
 * both come back as errors; for the latter the message carries the status
 * code and the server's `error` text.
 */
class RemoteApi {
public:
    explicit RemoteApi(std::shared_ptr<network::HttpTransport> transport);

    Result<model::StatusSnapshot> status();

    Result<std::vector<model::WaitingFile>> files();

    Result<model::DownloadedFile> download(const std::string& name);

    Result<model::DownloadedFile> download_last();

    Result<std::vector<model::RemoteFile>> browse(const std::optional<std::string>& path);

    Result<model::DownloadedFile> pull(const std::string& desktop_path);

    /**
     * @brief PUT /upload/{remote_name}, streaming `local_file` from disk
     */
    Result<void> upload(const std::filesystem::path& local_file, const std::string& remote_name);

    /**
     * @brief PUT /sync/upload to an absolute desktop path, optionally stamping its mtime
     */
    Result<void> sync_upload(const std::filesystem::path& local_file,
                             const std::string& desktop_path,
                             std::optional<uint64_t> mtime);

    Result<std::vector<model::PeerInfo>> peers();

    Result<std::vector<model::SyncProject>> projects();

    /**
     * @brief Create a project from this side's point of view
     *
     * The service stores desktop paths as `local_path` and mobile paths as
     * `remote_path`, so the arguments are swapped into that orientation.
     */
    Result<model::SyncProject> create_project(const std::string& mobile_path,
                                              const std::string& desktop_path);

    Result<void> delete_project(const std::string& id);

    Result<std::vector<model::SyncChange>> check();

    Result<void> ack(const std::string& id, uint64_t timestamp);

private:
    Result<network::HttpResponse> send(const network::HttpRequest& request);

    Result<nlohmann::json> send_json(const network::HttpRequest& request);

    template<typename T>
    Result<T> get_json(const std::string& target);

    Result<model::DownloadedFile> fetch_file(const std::string& target, const std::string& fallback_name);

    std::shared_ptr<network::HttpTransport> transport_;
};

} // namespace taildrive::client
