#include "ingest/network/url.hpp"

#include <gtest/gtest.h>

using ingest::ErrorCode;
using ingest::network::Url;
using ingest::network::encode_path_segment;
using ingest::network::join_url;

TEST(UrlTest, ParsesSchemeHostPortAndTarget) {
    auto url = Url::parse("https://cloud.example.com:8443/api/upload?x=1#frag");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().scheme, "https");
    EXPECT_EQ(url.value().host, "cloud.example.com");
    EXPECT_EQ(url.value().port, 8443);
    EXPECT_EQ(url.value().target, "/api/upload?x=1");
    EXPECT_TRUE(url.value().is_tls());
    EXPECT_EQ(url.value().host_header(), "cloud.example.com:8443");
}

TEST(UrlTest, DefaultsPortAndTarget) {
    auto plain = Url::parse("http://example.com");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value().port, 80);
    EXPECT_EQ(plain.value().target, "/");
    EXPECT_EQ(plain.value().host_header(), "example.com");

    auto tls = Url::parse("HTTPS://example.com/content/42");
    ASSERT_TRUE(tls.is_ok());
    EXPECT_EQ(tls.value().port, 443);
    EXPECT_EQ(tls.value().to_string(), "https://example.com/content/42");
}

TEST(UrlTest, ParsesIpv6Literal) {
    auto url = Url::parse("http://[::1]:9000/api");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "::1");
    EXPECT_EQ(url.value().port, 9000);
}

TEST(UrlTest, RejectsInvalidUrls) {
    EXPECT_EQ(Url::parse("cloud.example.com/api").error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(Url::parse("ftp://example.com/").is_error());
    EXPECT_TRUE(Url::parse("http:///path").is_error());
    EXPECT_TRUE(Url::parse("http://example.com:99999/").is_error());
    EXPECT_TRUE(Url::parse("http://example.com:0/").is_error());
    EXPECT_TRUE(Url::parse("http://example.com:8o/").is_error());
    EXPECT_TRUE(Url::parse("http://[::1/").is_error());
}

TEST(UrlTest, JoinUrlNormalisesSlashes) {
    EXPECT_EQ(join_url("https://x/api", "upload"), "https://x/api/upload");
    EXPECT_EQ(join_url("https://x/api/", "/upload/init"), "https://x/api/upload/init");
    EXPECT_EQ(join_url("https://x/api//", "health"), "https://x/api/health");
}

TEST(UrlTest, EncodesPathSegments) {
    EXPECT_EQ(encode_path_segment("order-42_a.b~c"), "order-42_a.b~c");
    EXPECT_EQ(encode_path_segment("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(encode_path_segment("\xC3\xA4"), "%C3%A4");
}
