#include "ingest/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using ingest::network::HttpMessageParser;
using ingest::network::HttpMethod;
using ingest::network::ParseState;

namespace {

ingest::Result<bool> feed(HttpMessageParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesResponseWithContentLength) {
    HttpMessageParser parser(HttpMessageParser::Kind::Response);

    auto result = feed(parser,
        "HTTP/1.1 201 Created\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 17\r\n"
        "\r\n"
        "{\"order_id\":\"42\"}");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 201);
    EXPECT_EQ(response.reason_phrase, "Created");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_EQ(response.body_as_string(), "{\"order_id\":\"42\"}");
}

TEST(HttpParserTest, HandlesDataSplitAcrossReads) {
    HttpMessageParser parser(HttpMessageParser::Kind::Response);
    const std::string wire = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";

    for (std::size_t i = 0; i + 1 < wire.size(); ++i) {
        auto step = parser.parse(&wire[i], 1);
        ASSERT_TRUE(step.is_ok()) << "byte " << i;
        EXPECT_FALSE(step.value());
    }
    auto last = parser.parse(&wire.back(), 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "hello");
}

TEST(HttpParserTest, DecodesChunkedBody) {
    HttpMessageParser parser(HttpMessageParser::Kind::Response);

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

TEST(HttpParserTest, BodyUntilCloseNeedsFinish) {
    HttpMessageParser parser(HttpMessageParser::Kind::Response);

    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\npartial body");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(parser.state(), ParseState::BODY_UNTIL_EOF);

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.get_response().body_as_string(), "partial body");
}

TEST(HttpParserTest, TruncatedFixedBodyIsAnError) {
    HttpMessageParser parser(HttpMessageParser::Kind::Response);

    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc").is_ok());
    EXPECT_TRUE(parser.finish().is_error());
}

TEST(HttpParserTest, NoBodyForHeadAnd204) {
    HttpMessageParser head(HttpMessageParser::Kind::Response);
    head.set_expect_no_body(true);
    auto head_result = feed(head, "HTTP/1.1 200 OK\r\nContent-Length: 1234\r\n\r\n");
    ASSERT_TRUE(head_result.is_ok());
    EXPECT_TRUE(head_result.value());

    HttpMessageParser no_content(HttpMessageParser::Kind::Response);
    auto result = feed(no_content, "HTTP/1.1 204 No Content\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(no_content.get_response().body.empty());
}

TEST(HttpParserTest, ParsesRequestWithBody) {
    HttpMessageParser parser(HttpMessageParser::Kind::Request);

    auto result = feed(parser,
        "POST /api/upload/complete?x=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 20\r\n"
        "\r\n"
        "{\"session_id\":\"s-1\"}");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    auto request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.target, "/api/upload/complete?x=1");
    EXPECT_EQ(request.path(), "/api/upload/complete");
    EXPECT_EQ(request.body_as_string(), "{\"session_id\":\"s-1\"}");
}

TEST(HttpParserTest, RequestWithoutLengthHasNoBody) {
    HttpMessageParser parser(HttpMessageParser::Kind::Request);

    auto result = feed(parser, "GET /api/health HTTP/1.1\r\nHost: x\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
}

TEST(HttpParserTest, RejectsMalformedInput) {
    HttpMessageParser bad_status(HttpMessageParser::Kind::Response);
    EXPECT_TRUE(feed(bad_status, "HTTP/1.1 2x0 OK\r\n").is_error());

    HttpMessageParser bad_header(HttpMessageParser::Kind::Response);
    EXPECT_TRUE(feed(bad_header, "HTTP/1.1 200 OK\r\nNo colon here\r\n").is_error());

    HttpMessageParser bad_length(HttpMessageParser::Kind::Response);
    EXPECT_TRUE(feed(bad_length, "HTTP/1.1 200 OK\r\nContent-Length: -5\r\n\r\n").is_error());

    HttpMessageParser bad_method(HttpMessageParser::Kind::Request);
    EXPECT_TRUE(feed(bad_method, "BREW /pot HTTP/1.1\r\n").is_error());
}

TEST(HttpParserTest, ResetAllowsReuse) {
    HttpMessageParser parser(HttpMessageParser::Kind::Response);
    ASSERT_TRUE(feed(parser, "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\n\r\n").is_ok());
    EXPECT_EQ(parser.get_response().status_code, 500);

    parser.reset();
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok").is_ok());
    EXPECT_EQ(parser.get_response().status_code, 200);
    EXPECT_EQ(parser.get_response().body_as_string(), "ok");
}
