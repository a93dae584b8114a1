#include "taildrive/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace taildrive {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_bytes)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_bytes) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                if (parser_.body_too_large()) {
                    handle_error(HttpStatus::PAYLOAD_TOO_LARGE, parse_result.error());
                } else {
                    handle_error(HttpStatus::BAD_REQUEST, "Parse error: " + parse_result.error());
                }
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();
            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                                 "Internal server error");
            }
            do_write(std::move(response));
        });
}

void HttpConnection::do_write(HttpResponse response) {
    auto self = shared_from_this();

    if (response.body_file) {
        file_.open(*response.body_file, std::ios::binary);
        if (!file_) {
            spdlog::error("Cannot open {} for streaming", response.body_file->string());
            response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                             "Cannot read file");
        }
    }

    response.set_header("Connection", "close");
    if (response.body_file) {
        const std::string head = response.serialize_head();
        out_.assign(head.begin(), head.end());
    } else {
        out_ = response.serialize();
    }

    asio::async_write(
        socket_,
        asio::buffer(out_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }
            spdlog::debug("Sent {} bytes", bytes_transferred);
            if (file_.is_open()) {
                file_slice_.resize(kFileSliceBytes);
                write_file_slice();
            } else {
                close();
            }
        });
}

void HttpConnection::write_file_slice() {
    file_.read(file_slice_.data(), static_cast<std::streamsize>(file_slice_.size()));
    const auto count = static_cast<std::size_t>(file_.gcount());
    if (count == 0) {
        file_.close();
        close();
        return;
    }

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(file_slice_.data(), count),
        [this, self](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error while streaming file: {}", ec.message());
                }
                return;
            }
            write_file_slice();
        });
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(status, message));
}

void HttpConnection::close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message + "\n");
    response.set_header("Content-Type", "text/plain");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(std::string bind_address, uint16_t port,
                               std::size_t worker_threads, std::size_t max_body_bytes)
    : acceptor_(io_context_)
    , bind_address_(std::move(bind_address))
    , port_(port)
    , worker_threads_(worker_threads == 0 ? 1 : worker_threads)
    , max_body_bytes_(max_body_bytes) {
}

HttpServerAsio::~HttpServerAsio() {
    stop();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

Result<void> HttpServerAsio::start() {
    if (running_) {
        return Err(std::string("Server already running"));
    }
    if (!handler_) {
        return Err(std::string("No request handler set"));
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(bind_address_, ec);
    if (ec) {
        return Err("Invalid bind address '" + bind_address_ + "': " + ec.message());
    }

    const tcp::endpoint endpoint(address, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return Err("Cannot listen on " + bind_address_ + ":" + std::to_string(port_) +
                   ": " + ec.message());
    }

    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    do_accept();

    for (std::size_t i = 0; i < worker_threads_; ++i) {
        workers_.emplace_back([this]() { io_context_.run(); });
    }

    spdlog::info("HTTP server listening on {}:{} ({} worker threads)",
                 bind_address_, port_, worker_threads_);
    return Ok();
}

void HttpServerAsio::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    io_context_.stop();
    wait();
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    spdlog::info("HTTP server on port {} stopped", port_);
}

void HttpServerAsio::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                spdlog::debug("Accepted connection from {}",
                              socket.remote_endpoint(ec).address().to_string());
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_bytes_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace network
} // namespace taildrive
