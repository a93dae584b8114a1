#pragma once

#include "http_types.hpp"
#include "taildrive/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>

namespace taildrive {
namespace network {

namespace detail {

inline bool parse_size(const std::string& text, std::size_t& out, int base = 10) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) {
        return false;
    }
    const char* first = text.data() + begin;
    const char* last = text.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, out, base);
    return ec == std::errc() && ptr == last;
}

} // namespace detail

/**
 * @brief State machine states for HTTP request parsing
 *
 * Request format:
 * METHOD SP TARGET SP VERSION CRLF
 * Header-Name: Header-Value CRLF
 * CRLF
 * [Body of Content-Length bytes]
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 request parser
 *
 * Data can be fed in arbitrary chunks as it arrives from the socket. The
 * request line and headers are parsed character by character; the body is
 * copied in bulk. Requests whose declared body exceeds `max_body_bytes` are
 * rejected with body_too_large() set so the caller can answer 413.
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeadBytes = 64 * 1024;
    static constexpr std::size_t kDefaultMaxBodyBytes = std::size_t{1} << 30;

    explicit HttpParser(std::size_t max_body_bytes = kDefaultMaxBodyBytes)
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @return true once the request is complete, false if more data is needed,
     *         or an error describing the malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err(std::string("Parser in error state"));
            }

            if (state_ == ParseState::BODY) {
                const size_t wanted = expected_body_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() >= expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (++head_bytes_ > kMaxHeadBytes) {
                return fail("Request head exceeds " + std::to_string(kMaxHeadBytes) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD:
                    ok = parse_method(c);
                    break;
                case ParseState::URL:
                    ok = parse_url(c);
                    break;
                case ParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                default:
                    break;
            }
            if (!ok) {
                return fail(error_context_.empty()
                                ? "Malformed request at line " + std::to_string(line_)
                                : error_context_);
            }
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const { return request_; }

    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    bool body_too_large() const { return body_too_large_; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_context_.clear();
        expected_body_ = 0;
        head_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_context_;
    std::size_t expected_body_;
    std::size_t head_bytes_;
    std::size_t max_body_bytes_;
    size_t line_;
    bool last_char_was_cr_;
    bool body_too_large_;

    Result<bool> fail(const std::string& message) {
        state_ = ParseState::PARSE_ERROR;
        return Err(message);
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_context_ = "Unsupported HTTP method: " + buffer_;
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.target = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                error_context_ = "Unsupported HTTP version: " + buffer_;
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool finish_headers() {
        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::size_t body_length = 0;
        if (!detail::parse_size(content_length, body_length)) {
            error_context_ = "Invalid Content-Length: " + content_length;
            return false;
        }
        if (body_length > max_body_bytes_) {
            body_too_large_ = true;
            error_context_ = "Request body of " + content_length + " bytes exceeds limit";
            return false;
        }
        if (body_length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        expected_body_ = body_length;
        request_.body.reserve(body_length);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace taildrive
