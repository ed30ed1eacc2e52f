#include "dsync/network/http_response_parser.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

using dsync::ErrorKind;
using dsync::network::HttpResponseParser;
using dsync::network::ResponseParseState;

namespace {

dsync::Result<bool> feed(HttpResponseParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpResponseParserTest, ContentLengthBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "{\"href\":\"x\"}\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    const auto& response = parser.get_response();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.reason_phrase, "OK");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_EQ(response.body_as_string(), "{\"href\":\"x\"}\n");
}

TEST(HttpResponseParserTest, InputSplitAtEveryByte) {
    const std::string raw =
        "HTTP/1.1 201 Created\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";

    HttpResponseParser parser;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        auto result = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(result.is_ok()) << "byte " << i;
        EXPECT_EQ(result.value(), i + 1 == raw.size());
    }
    EXPECT_EQ(parser.get_response().status_code, 201);
    EXPECT_EQ(parser.get_response().body_as_string(), "hello");
}

TEST(HttpResponseParserTest, ChunkedBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "7;ext=1\r\n, world\r\n"
        "0\r\n"
        "\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "hello, world");
}

TEST(HttpResponseParserTest, ChunkedBodyWithTrailer) {
    HttpResponseParser parser;
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "3\r\nabc\r\n"
        "0\r\n"
        "X-Checksum: 1\r\n"
        "\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.get_response().body_as_string(), "abc");
}

TEST(HttpResponseParserTest, NoContentHasNoBody) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 204 No Content\r\n\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.get_response().body.empty());
}

TEST(HttpResponseParserTest, HeadResponseIgnoresContentLength) {
    HttpResponseParser parser(false);
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
}

TEST(HttpResponseParserTest, BodyUntilClose) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\npartial");

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(parser.state(), ResponseParseState::BODY_UNTIL_CLOSE);

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(parser.get_response().body_as_string(), "partial");
}

TEST(HttpResponseParserTest, TruncatedBodyIsAnError) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_error());
    EXPECT_TRUE(finished.error().is(ErrorKind::Protocol));
}

TEST(HttpResponseParserTest, RejectsBadStatusLine) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/2.0 200 OK\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Protocol));
    EXPECT_EQ(parser.state(), ResponseParseState::PARSE_ERROR);
}

TEST(HttpResponseParserTest, RejectsNonNumericStatus) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 2x0 OK\r\n\r\n");
    EXPECT_TRUE(result.is_error());
}

TEST(HttpResponseParserTest, RejectsBadChunkSize) {
    HttpResponseParser parser;
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    EXPECT_TRUE(result.is_error());
}

TEST(HttpResponseParserTest, ResetAllowsReuse) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n").is_ok());
    EXPECT_EQ(parser.get_response().status_code, 404);

    parser.reset();
    ASSERT_TRUE(feed(parser, "HTTP/1.1 409 Conflict\r\nContent-Length: 2\r\n\r\n{}").is_ok());
    EXPECT_EQ(parser.get_response().status_code, 409);
    EXPECT_EQ(parser.get_response().body_as_string(), "{}");
}
