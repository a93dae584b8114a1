#include "taildrive/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace taildrive::network;

namespace {

taildrive::Result<bool> feed(HttpParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpParser, ParsesSimpleGet) {
    HttpParser parser;
    auto result = feed(parser, "GET /browse?path=%2Ftmp HTTP/1.1\r\nHost: desktop\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    const HttpRequest request = parser.take_request();
    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.target, "/browse?path=%2Ftmp");
    EXPECT_EQ(request.path(), "/browse");
    EXPECT_EQ(request.query_string(), "path=%2Ftmp");
    EXPECT_EQ(request.get_header("host"), "desktop");
}

TEST(HttpParser, ParsesIncrementally) {
    const std::string raw =
        "PUT /sync/upload?path=%2Ftmp%2Fx HTTP/1.1\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "hello world";

    HttpParser parser;
    for (std::size_t i = 0; i + 1 < raw.size(); ++i) {
        auto partial = parser.parse(&raw[i], 1);
        ASSERT_TRUE(partial.is_ok()) << "at byte " << i;
        EXPECT_FALSE(partial.value()) << "completed early at byte " << i;
    }
    auto last = parser.parse(&raw.back(), 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());

    const HttpRequest request = parser.take_request();
    EXPECT_EQ(request.method, HttpMethod::PUT);
    EXPECT_EQ(request.body_as_string(), "hello world");
}

TEST(HttpParser, BodySplitAcrossReads) {
    HttpParser parser;
    auto head = feed(parser, "POST /sync/ack HTTP/1.1\r\nContent-Length: 26\r\n\r\n{\"id\":\"ab\",");
    ASSERT_TRUE(head.is_ok());
    EXPECT_FALSE(head.value());

    auto rest = feed(parser, "\"timestamp\":5}");
    ASSERT_TRUE(rest.is_ok());
    EXPECT_TRUE(rest.value());
    EXPECT_EQ(parser.get_request().body_as_string(), "{\"id\":\"ab\",\"timestamp\":5}");
}

TEST(HttpParser, RejectsOversizedBody) {
    HttpParser parser(16);
    auto result = feed(parser, "PUT /upload/a HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(parser.body_too_large());
}

TEST(HttpParser, RejectsInvalidContentLength) {
    HttpParser parser;
    auto result = feed(parser, "PUT /upload/a HTTP/1.1\r\nContent-Length: ten\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(parser.body_too_large());
}

TEST(HttpParser, RejectsGarbage) {
    HttpParser parser;
    EXPECT_TRUE(feed(parser, "\x01\x02 nonsense\r\n\r\n").is_error());
}
