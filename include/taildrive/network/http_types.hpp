#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace taildrive {
namespace network {

/**
 * @brief HTTP request methods understood by the server and the client
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a macro on some platforms
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes produced by the status/sync service
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    ACCEPTED = 202,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/**
 * @brief Case-insensitive header lookup (RFC 7230 header names are
 *        case-insensitive, but we store them as received)
 */
inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

/**
 * @brief An HTTP request, either parsed by the server or built by the client
 *
 * `target` is the raw request-target including the query string, exactly as
 * it appears on the request line. Use path() and query_string() to split it.
 *
 * A client request may carry its body as a file on disk (`body_file`) so that
 * large uploads are streamed rather than loaded into memory.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string target;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::optional<std::filesystem::path> body_file;

    HttpRequest() = default;
    HttpRequest(HttpMethod m, std::string t) : method(m), target(std::move(t)) {}

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string path() const {
        const auto pos = target.find('?');
        return pos == std::string::npos ? target : target.substr(0, pos);
    }

    std::string query_string() const {
        const auto pos = target.find('?');
        return pos == std::string::npos ? std::string() : target.substr(pos + 1);
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        body_file.reset();
    }

    void set_body(std::vector<uint8_t> data) {
        body = std::move(data);
        body_file.reset();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief An HTTP response
 *
 * The body is either held in memory (`body`) or streamed from disk
 * (`body_file`). serialize_head() produces the status line and headers only;
 * the connection writes the body separately so a file body never has to be
 * loaded as a whole.
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::optional<std::filesystem::path> body_file;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        body_file.reset();
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(std::vector<uint8_t> data) {
        body = std::move(data);
        body_file.reset();
        headers["Content-Length"] = std::to_string(body.size());
    }

    /**
     * @brief Stream the body from a file of known size
     */
    void set_body_file(const std::filesystem::path& path, std::uintmax_t size) {
        body.clear();
        body_file = path;
        headers["Content-Length"] = std::to_string(size);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    std::string serialize_head() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";
        return oss.str();
    }

    /**
     * @brief Status line, headers and in-memory body as one buffer
     */
    std::vector<uint8_t> serialize() const {
        const std::string head = serialize_head();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::ACCEPTED: return "Accepted";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::BAD_GATEWAY: return "Bad Gateway";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace taildrive
