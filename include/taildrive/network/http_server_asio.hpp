#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "http_parser.hpp"
#include "http_types.hpp"
#include "taildrive/core/result.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace taildrive {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. Once a full request is parsed the handler runs and the response head
 *    (plus any in-memory body) is written
 * 4. A file-backed body is then streamed in 64 KiB slices
 * 5. The socket is shut down; one request per connection
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    static constexpr std::size_t kFileSliceBytes = 64 * 1024;

    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_bytes);

    void start();

private:
    void do_read();

    void do_write(HttpResponse response);

    // Writes the next slice of file_ or finishes the response
    void write_file_slice();

    void handle_error(HttpStatus status, const std::string& message);

    void close();

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 16384> buffer_;
    std::vector<uint8_t> out_;              // Response head and in-memory body
    std::ifstream file_;                    // File body being streamed, if any
    std::vector<char> file_slice_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Owns its io_context and runs it on a fixed number of worker threads, so
 * handlers that block on backend I/O do not stall other connections.
 *
 * Usage:
 * ```cpp
 * HttpServerAsio server("0.0.0.0", 8080, 4);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * auto started = server.start();
 * ...
 * server.stop();
 * ```
 */
class HttpServerAsio {
public:
    HttpServerAsio(std::string bind_address, uint16_t port, std::size_t worker_threads,
                   std::size_t max_body_bytes = HttpParser::kDefaultMaxBodyBytes);
    ~HttpServerAsio();

    HttpServerAsio(const HttpServerAsio&) = delete;
    HttpServerAsio& operator=(const HttpServerAsio&) = delete;

    /**
     * @brief Set the request handler; must be called before start()
     */
    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Bind, listen and start the worker threads
     *
     * Port 0 binds an ephemeral port; get_port() reports the actual one.
     */
    Result<void> start();

    /**
     * @brief Stop accepting, abort the event loop and join the workers
     */
    void stop();

    /**
     * @brief Block until the worker threads exit
     */
    void wait();

    uint16_t get_port() const { return port_; }

    bool is_running() const { return running_; }

private:
    void do_accept();

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::string bind_address_;
    uint16_t port_;
    std::size_t worker_threads_;
    std::size_t max_body_bytes_;
    std::vector<std::thread> workers_;
    bool running_ = false;
};

} // namespace network
} // namespace taildrive
