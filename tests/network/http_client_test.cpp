#include "ingest/network/http_client.hpp"

#include "fake_api_server.hpp"
#include "temp_directory.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using ingest::ErrorCode;
using ingest::network::HttpClient;
using ingest::network::HttpMethod;
using ingest::network::HttpRequest;
using ingest::network::HttpResponse;
using ingest::testing::FakeApiServer;
using ingest::testing::TempDirectory;
using ingest::testing::pattern_bytes;
using ingest::testing::write_file;
using namespace std::chrono_literals;

TEST(HttpClientTest, GetReturnsStatusHeadersAndBody) {
    FakeApiServer server;
    server.on(HttpMethod::GET, "/api/health", [](const HttpRequest& request) {
        if (request.get_header("Authorization") != "Bearer key_1.secret") {
            return FakeApiServer::json_response(401, {{"status", "unauthorized"}});
        }
        return FakeApiServer::json_response(200, {{"status", "healthy"}});
    });

    HttpClient client;
    auto response = client.get(server.url("/api/health"), {{"Authorization", "Bearer key_1.secret"}}, 5s);

    ASSERT_TRUE(response.is_ok()) << response.error().message;
    EXPECT_EQ(response.value().status_code, 200);
    EXPECT_EQ(response.value().get_header("Content-Type"), "application/json");
    EXPECT_EQ(response.value().body_as_string(), "{\"status\":\"healthy\"}");

    auto recorded = server.requests_to("/api/health");
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].get_header("Connection"), "close");
    EXPECT_EQ(recorded[0].get_header("User-Agent"), "media-ingest/1.0");
    EXPECT_EQ(recorded[0].get_header("Host"), "127.0.0.1:" + std::to_string(server.port()));
}

TEST(HttpClientTest, NonSuccessStatusIsAResponse) {
    FakeApiServer server;
    server.on(HttpMethod::POST, "/api/upload", [](const HttpRequest&) {
        return FakeApiServer::text_response(500, "boom");
    });

    HttpClient client;
    auto response = client.post(server.url("/api/upload"), std::string("{}"), "application/json", {}, 5s);

    ASSERT_TRUE(response.is_ok());
    EXPECT_EQ(response.value().status_code, 500);
    EXPECT_EQ(response.value().body_as_string(), "boom");
}

TEST(HttpClientTest, SendsLargeBinaryBody) {
    FakeApiServer server;
    server.on(HttpMethod::PUT, "/blob/a.bin", [](const HttpRequest& request) {
        return FakeApiServer::json_response(201, {{"received", request.body.size()},
                                                  {"type", request.get_header("Content-Type")}});
    });

    std::vector<std::uint8_t> body(3 * 1024 * 1024 + 17, 0xAB);
    HttpClient client;
    auto response = client.put(server.url("/blob/a.bin"), body, "application/octet-stream",
                               {{"x-ms-blob-type", "BlockBlob"}}, 10s);

    ASSERT_TRUE(response.is_ok()) << response.error().message;
    EXPECT_EQ(response.value().status_code, 201);
    EXPECT_EQ(response.value().body_as_string(),
              "{\"received\":" + std::to_string(body.size()) + ",\"type\":\"application/octet-stream\"}");

    auto recorded = server.requests_to("/blob/a.bin");
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].body, body);
    EXPECT_EQ(recorded[0].get_header("x-ms-blob-type"), "BlockBlob");
}

TEST(HttpClientTest, PutFileStreamsBodyInBlocks) {
    FakeApiServer server;
    server.on(HttpMethod::PUT, "/blob/clip.mp4", [](const HttpRequest&) {
        return FakeApiServer::text_response(201, "");
    });
    TempDirectory dir("http_client_test");
    const auto content = pattern_bytes(3 * HttpClient::kStreamBlockSize + 17, 5);
    write_file(dir / "clip.mp4", content);

    HttpClient client;
    auto response = client.put_file(server.url("/blob/clip.mp4"), dir / "clip.mp4", "video/mp4",
                                    {{"x-ms-blob-type", "BlockBlob"}}, 10s);

    ASSERT_TRUE(response.is_ok()) << response.error().message;
    EXPECT_EQ(response.value().status_code, 201);

    auto recorded = server.requests_to("/blob/clip.mp4");
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].get_header("Content-Length"), std::to_string(content.size()));
    EXPECT_EQ(recorded[0].get_header("Content-Type"), "video/mp4");
    EXPECT_EQ(recorded[0].body.size(), content.size());
    EXPECT_EQ(recorded[0].body, content);
}

TEST(HttpClientTest, PutFileOfMissingFileIsIoError) {
    FakeApiServer server;
    TempDirectory dir("http_client_test");

    HttpClient client;
    auto response = client.put_file(server.url("/blob/gone.mp4"), dir / "gone.mp4", "video/mp4", {}, 5s);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::IoError);
    EXPECT_TRUE(server.requests().empty());
}

TEST(HttpClientTest, TimesOutWhenServerStalls) {
    FakeApiServer server;
    server.on(HttpMethod::GET, "/api/slow", [](const HttpRequest&) {
        std::this_thread::sleep_for(600ms);
        return FakeApiServer::text_response(200, "late");
    });

    HttpClient client;
    const auto start = std::chrono::steady_clock::now();
    auto response = client.get(server.url("/api/slow"), {}, 150ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Timeout);
    EXPECT_LT(elapsed, 550ms);
}

TEST(HttpClientTest, ConnectionRefusedIsIoError) {
    // Grab a free port, then close it again
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(
        io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();
    acceptor.close();

    HttpClient client;
    auto response = client.get("http://127.0.0.1:" + std::to_string(port) + "/", {}, 2s);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::IoError);
}

TEST(HttpClientTest, InvalidUrlIsRejected) {
    HttpClient client;
    auto response = client.get("not a url", {}, 1s);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::InvalidArgument);
}

TEST(HttpClientTest, UnroutedPathGets404) {
    FakeApiServer server;

    HttpClient client;
    auto response = client.get(server.url("/api/nothing"), {}, 5s);

    ASSERT_TRUE(response.is_ok());
    EXPECT_EQ(response.value().status_code, 404);
}
