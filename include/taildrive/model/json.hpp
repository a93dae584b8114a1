#pragma once

#include "taildrive/model/types.hpp"

#include <nlohmann/json.hpp>

namespace taildrive::model {

// Wire and storage codecs. from_json is strict about types and lenient about
// missing optional keys; callers catch nlohmann::json::exception.

void to_json(nlohmann::json& j, const SentFileInfo& info);
void from_json(const nlohmann::json& j, SentFileInfo& info);

void to_json(nlohmann::json& j, const WaitingFile& file);
void from_json(const nlohmann::json& j, WaitingFile& file);

void to_json(nlohmann::json& j, const RemoteFile& file);
void from_json(const nlohmann::json& j, RemoteFile& file);

// is_self is not part of the wire form
void to_json(nlohmann::json& j, const PeerInfo& peer);
void from_json(const nlohmann::json& j, PeerInfo& peer);

void to_json(nlohmann::json& j, const SyncProject& project);
void from_json(const nlohmann::json& j, SyncProject& project);

void to_json(nlohmann::json& j, const SyncChange& change);
void from_json(const nlohmann::json& j, SyncChange& change);

nlohmann::json status_to_json(const StatusSnapshot& status);
StatusSnapshot status_from_json(const nlohmann::json& j);

} // namespace taildrive::model
