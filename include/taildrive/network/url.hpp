#pragma once

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

namespace taildrive {
namespace network {

using QueryParams = std::unordered_map<std::string, std::string>;

/**
 * @brief Percent-encode a single path segment or query value
 *
 * Unreserved characters (RFC 3986 section 2.3) pass through; everything
 * else, including '/', is encoded.
 */
std::string url_encode(const std::string& value);

/**
 * @brief Percent-encode a path, keeping '/' separators intact
 */
std::string url_encode_path(const std::string& path);

/**
 * @brief Decode %XX escapes; when `plus_as_space` is set, '+' becomes ' '
 *
 * Malformed escapes are kept verbatim.
 */
std::string url_decode(const std::string& value, bool plus_as_space = false);

/**
 * @brief Parse "a=1&b=two" into a map (keys and values are decoded)
 *
 * Repeated keys keep the last value.
 */
QueryParams parse_query(const std::string& query);

/**
 * @brief Build "?a=1&b=2" from ordered key/value pairs (empty map → "")
 */
std::string build_query(const std::initializer_list<std::pair<std::string, std::string>>& params);

/**
 * @brief Build `attachment; filename="..."` with the name as a quoted-string
 *
 * Quotes and backslashes are backslash-escaped; control characters become '_'.
 */
std::string content_disposition_attachment(const std::string& filename);

/**
 * @brief Extract the filename from a Content-Disposition header value
 *
 * Backslash escapes inside the quoted name are undone. Returns an empty
 * string when no complete `filename="..."` part is present.
 */
std::string content_disposition_filename(const std::string& header_value);

} // namespace network
} // namespace taildrive
