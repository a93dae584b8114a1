#include "taildrive/network/http_client.hpp"
#include "taildrive/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/file_body.hpp>

#include <array>

#include <strings.h>

namespace taildrive {
namespace network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using unix_stream = asio::local::stream_protocol;

namespace {

constexpr std::size_t kReadSliceBytes = 16 * 1024;
constexpr auto kStreamPollSlice = std::chrono::milliseconds(250);

/**
 * Runs `io` until the single pending operation sets `done`.
 *
 * Without `keep_running` the operation gets `timeout`; on expiry `cancel`
 * aborts it and an error is returned. With `keep_running` there is no
 * deadline, but the predicate is polled every slice; once it turns false the
 * operation is aborted and the result is Ok(false).
 *
 * Aborted handlers are always drained before returning, since they capture
 * the caller's locals by reference.
 */
Result<bool> await(asio::io_context& io,
                   const bool& done,
                   const boost::system::error_code& ec,
                   std::chrono::milliseconds timeout,
                   const std::function<bool()>* keep_running,
                   const std::function<void()>& cancel,
                   const std::string& what) {
    const bool open_ended = keep_running && *keep_running;

    io.restart();
    if (open_ended) {
        while (!done && (*keep_running)()) {
            io.run_for(kStreamPollSlice);
        }
    } else {
        io.run_for(timeout);
    }

    if (!done) {
        cancel();
        io.restart();
        io.run();
        if (open_ended) {
            return Ok(false);
        }
        return Err(what + " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    if (ec) {
        return Err(what + " failed: " + ec.message());
    }
    return Ok(true);
}

template <typename Body>
void fill_request(http::request<Body>& message,
                  const HttpRequest& request,
                  const std::string& target,
                  const std::string& host) {
    message.version(11);
    message.method_string(HttpMethodUtils::to_string(request.method));
    message.target(target);
    for (const auto& [name, value] : request.headers) {
        if (strcasecmp(name.c_str(), "Host") == 0 ||
            strcasecmp(name.c_str(), "Content-Length") == 0 ||
            strcasecmp(name.c_str(), "Transfer-Encoding") == 0 ||
            strcasecmp(name.c_str(), "Connection") == 0) {
            continue;
        }
        message.set(name, value);
    }
    message.set(http::field::host, host);
    message.set(http::field::connection, "close");
    message.prepare_payload();
}

HttpResponse response_head(const http::response<http::buffer_body>& message) {
    HttpResponse response;
    response.version = message.version() == 10 ? HttpVersion::HTTP_1_0 : HttpVersion::HTTP_1_1;
    response.status_code = static_cast<int>(message.result_int());
    const auto reason = message.reason();
    response.reason_phrase.assign(reason.data(), reason.size());
    for (const auto& field : message) {
        const auto name = field.name_string();
        const auto value = field.value();
        response.headers[std::string(name.data(), name.size())] = std::string(value.data(), value.size());
    }
    return response;
}

template <typename Socket>
class Exchange {
public:
    Exchange(asio::io_context& io, Socket& socket, std::chrono::milliseconds timeout)
        : io_(io)
        , socket_(socket)
        , timeout_(timeout)
        , cancel_([&socket]() {
            boost::system::error_code ignored;
            socket.close(ignored);
        }) {
    }

    /**
     * Writes the request in serializer-sized pieces, each under its own
     * deadline, so large file uploads are not bounded by a single timeout.
     */
    template <typename Body>
    Result<void> write(http::request<Body>& message) {
        http::request_serializer<Body> serializer(message);
        while (!serializer.is_done()) {
            bool done = false;
            beast::error_code ec;
            http::async_write_some(socket_, serializer,
                                   [&](const beast::error_code& error, std::size_t) {
                                       ec = error;
                                       done = true;
                                   });
            auto waited = await(io_, done, ec, timeout_, nullptr, cancel_, "Sending request");
            if (waited.is_error()) {
                return Err(waited.error());
            }
        }
        return Ok();
    }

    Result<HttpResponse> read(bool head_only,
                              const BodyHandler* on_body,
                              const std::function<bool()>* keep_running) {
        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(boost::none);
        parser.skip(head_only);

        {
            bool done = false;
            beast::error_code ec;
            http::async_read_header(socket_, buffer, parser,
                                    [&](const beast::error_code& error, std::size_t) {
                                        ec = error;
                                        done = true;
                                    });
            auto waited = await(io_, done, ec, timeout_, nullptr, cancel_, "Reading response");
            if (waited.is_error()) {
                return Err(waited.error());
            }
        }

        HttpResponse response = response_head(parser.get());

        // Only a successful streamed body may wait without a deadline
        const bool to_sink = on_body && response.is_success();

        std::array<char, kReadSliceBytes> slice;
        while (!parser.is_done()) {
            parser.get().body().data = slice.data();
            parser.get().body().size = slice.size();

            bool done = false;
            beast::error_code ec;
            http::async_read_some(socket_, buffer, parser,
                                  [&](const beast::error_code& error, std::size_t) {
                                      ec = error == http::error::need_buffer ? beast::error_code() : error;
                                      done = true;
                                  });
            auto waited = await(io_, done, ec, timeout_, to_sink ? keep_running : nullptr,
                                cancel_, "Reading response");
            if (waited.is_error()) {
                return Err(waited.error());
            }
            if (!waited.value()) {
                break;
            }

            const std::size_t received = slice.size() - parser.get().body().size;
            if (received == 0) {
                continue;
            }
            if (to_sink) {
                if (!(*on_body)(slice.data(), received)) {
                    break;
                }
            } else {
                response.body.insert(response.body.end(),
                                     reinterpret_cast<const uint8_t*>(slice.data()),
                                     reinterpret_cast<const uint8_t*>(slice.data() + received));
            }
        }

        cancel_();
        return Ok(std::move(response));
    }

private:
    asio::io_context& io_;
    Socket& socket_;
    std::chrono::milliseconds timeout_;
    std::function<void()> cancel_;
};

template <typename Socket>
Result<HttpResponse> exchange(asio::io_context& io,
                              Socket& socket,
                              const HttpRequest& request,
                              const std::string& target,
                              const std::string& host,
                              std::chrono::milliseconds timeout,
                              const BodyHandler* on_body,
                              const std::function<bool()>* keep_running) {
    Exchange<Socket> session(io, socket, timeout);

    if (request.body_file) {
        http::request<http::file_body> message;
        beast::error_code ec;
        message.body().open(request.body_file->c_str(), beast::file_mode::scan, ec);
        if (ec) {
            return Err("Cannot open " + request.body_file->string() + ": " + ec.message());
        }
        fill_request(message, request, target, host);
        auto sent = session.write(message);
        if (sent.is_error()) {
            return Err(sent.error());
        }
    } else {
        http::request<http::string_body> message;
        message.body().assign(request.body.begin(), request.body.end());
        fill_request(message, request, target, host);
        auto sent = session.write(message);
        if (sent.is_error()) {
            return Err(sent.error());
        }
    }

    return session.read(request.method == HttpMethod::HEAD, on_body, keep_running);
}

} // namespace

// ──────────────────────────────────────────────────────────
// Endpoint
// ──────────────────────────────────────────────────────────

Result<Endpoint> Endpoint::from_url(const std::string& url) {
    std::string rest = url;
    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        const std::string scheme = rest.substr(0, scheme_end);
        if (scheme != "http") {
            return Err("Unsupported URL scheme '" + scheme + "' in " + url);
        }
        rest = rest.substr(scheme_end + 3);
    }

    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    std::string base_path = slash == std::string::npos ? "" : rest.substr(slash);
    while (!base_path.empty() && base_path.back() == '/') {
        base_path.pop_back();
    }
    if (authority.empty()) {
        return Err("Missing host in URL " + url);
    }

    Endpoint endpoint;
    endpoint.kind = Kind::Tcp;
    endpoint.base_path = base_path;

    std::string port_text;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err("Malformed IPv6 host in URL " + url);
        }
        endpoint.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err("Malformed authority in URL " + url);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.find(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (endpoint.host.empty()) {
        return Err("Missing host in URL " + url);
    }
    if (!port_text.empty()) {
        std::size_t port = 0;
        if (!detail::parse_size(port_text, port) || port == 0 || port > 65535) {
            return Err("Invalid port '" + port_text + "' in URL " + url);
        }
        endpoint.port = static_cast<uint16_t>(port);
    }
    return Ok(std::move(endpoint));
}

Endpoint Endpoint::unix_socket(std::string path, std::string host_header) {
    Endpoint endpoint;
    endpoint.kind = Kind::Unix;
    endpoint.socket_path = std::move(path);
    endpoint.host = std::move(host_header);
    endpoint.port = 0;
    return endpoint;
}

std::string Endpoint::host_header() const {
    if (kind == Kind::Unix) {
        return host;
    }
    const std::string name = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return port == 80 ? name : name + ":" + std::to_string(port);
}

std::string Endpoint::describe() const {
    if (kind == Kind::Unix) {
        return "unix:" + socket_path;
    }
    return "http://" + host_header() + base_path;
}

// ──────────────────────────────────────────────────────────
// AsioHttpTransport
// ──────────────────────────────────────────────────────────

AsioHttpTransport::AsioHttpTransport(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout) {
}

Result<HttpResponse> AsioHttpTransport::round_trip(const HttpRequest& request) {
    return perform(request, nullptr, nullptr);
}

Result<HttpResponse> AsioHttpTransport::stream(const HttpRequest& request,
                                               const BodyHandler& on_body,
                                               const std::function<bool()>& keep_running) {
    return perform(request, &on_body, &keep_running);
}

Result<HttpResponse> AsioHttpTransport::perform(const HttpRequest& request,
                                                const BodyHandler* on_body,
                                                const std::function<bool()>* keep_running) {
    asio::io_context io;
    const std::string target = endpoint_.base_path + request.target;
    const std::string host = endpoint_.host_header();

    bool done = false;
    boost::system::error_code ec;

    if (endpoint_.kind == Endpoint::Kind::Unix) {
        unix_stream::socket socket(io);
        socket.async_connect(unix_stream::endpoint(endpoint_.socket_path),
                             [&](const boost::system::error_code& error) {
                                 ec = error;
                                 done = true;
                             });
        auto connected = await(io, done, ec, timeout_, nullptr,
                               [&socket]() {
                                   boost::system::error_code ignored;
                                   socket.close(ignored);
                               },
                               "Connecting to " + endpoint_.describe());
        if (connected.is_error()) {
            return Err(connected.error());
        }
        return exchange(io, socket, request, target, host, timeout_, on_body, keep_running);
    }

    tcp::resolver resolver(io);
    tcp::resolver::results_type results;
    resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
                           [&](const boost::system::error_code& error,
                               tcp::resolver::results_type resolved) {
                               ec = error;
                               results = std::move(resolved);
                               done = true;
                           });
    auto resolved = await(io, done, ec, timeout_, nullptr,
                          [&resolver]() { resolver.cancel(); },
                          "Resolving " + endpoint_.host);
    if (resolved.is_error()) {
        return Err(resolved.error());
    }

    tcp::socket socket(io);
    done = false;
    asio::async_connect(socket, results,
                        [&](const boost::system::error_code& error, const tcp::endpoint&) {
                            ec = error;
                            done = true;
                        });
    auto connected = await(io, done, ec, timeout_, nullptr,
                           [&socket]() {
                               boost::system::error_code ignored;
                               socket.close(ignored);
                           },
                           "Connecting to " + endpoint_.describe());
    if (connected.is_error()) {
        return Err(connected.error());
    }
    return exchange(io, socket, request, target, host, timeout_, on_body, keep_running);
}

} // namespace network
} // namespace taildrive
