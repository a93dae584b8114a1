#pragma once

#include "http_types.hpp"
#include "taildrive/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace taildrive {
namespace network {

/**
 * @brief Where an HTTP client connects to
 *
 * Either a TCP host/port (the desktop status service) or a Unix-domain
 * socket (the overlay daemon's local control API). `base_path` is prepended
 * to every request target.
 */
struct Endpoint {
    enum class Kind { Tcp, Unix };

    Kind kind = Kind::Tcp;
    std::string host;            ///< TCP host, or the Host header value for Unix sockets
    uint16_t port = 80;
    std::string socket_path;     ///< Unix socket path
    std::string base_path;       ///< Path prefix without trailing slash

    /**
     * @brief Parse "http://host[:port][/prefix]"; the scheme may be omitted
     */
    static Result<Endpoint> from_url(const std::string& url);

    static Endpoint unix_socket(std::string path, std::string host_header);

    std::string host_header() const;

    std::string describe() const;
};

/**
 * @brief Receives body bytes of a streamed response; return false to stop
 */
using BodyHandler = std::function<bool(const char*, std::size_t)>;

/**
 * @brief Blocking HTTP/1.1 request/response exchange
 *
 * Implementations must be safe to call from several threads at once.
 * A non-2xx status is not an error at this level: the response is returned
 * and callers decide. Errors are transport failures (connect, timeout,
 * malformed response).
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> round_trip(const HttpRequest& request) = 0;

    /**
     * @brief Perform a request whose 2xx body is delivered incrementally
     *
     * Body bytes of a successful response go to `on_body` and are not stored;
     * a non-2xx body is buffered into the returned response as usual.
     * `keep_running` is polled while waiting for data; when it returns false
     * the connection is dropped and the call returns the response head.
     */
    virtual Result<HttpResponse> stream(const HttpRequest& request,
                                        const BodyHandler& on_body,
                                        const std::function<bool()>& keep_running) = 0;
};

/**
 * @brief HttpTransport over Boost.Asio sockets
 *
 * Each call opens a fresh connection on a private io_context and sends
 * `Connection: close`, so the object carries no per-call state. Every
 * individual connect, write and read must finish within `timeout`; streamed
 * reads wait indefinitely but poll `keep_running`. Messages are framed by
 * Boost.Beast; a request with `body_file` set is uploaded through
 * `http::file_body` without loading the file.
 */
class AsioHttpTransport : public HttpTransport {
public:
    AsioHttpTransport(Endpoint endpoint, std::chrono::milliseconds timeout);

    Result<HttpResponse> round_trip(const HttpRequest& request) override;

    Result<HttpResponse> stream(const HttpRequest& request,
                                const BodyHandler& on_body,
                                const std::function<bool()>& keep_running) override;

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Result<HttpResponse> perform(const HttpRequest& request,
                                 const BodyHandler* on_body,
                                 const std::function<bool()>* keep_running);

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace taildrive
