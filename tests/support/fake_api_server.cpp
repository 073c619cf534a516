#include "fake_api_server.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace ingest::testing {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

// ──────────────────────────────────────────────────────────
// Connection
// ──────────────────────────────────────────────────────────

FakeApiServer::Connection::Connection(tcp::socket socket, FakeApiServer& server)
    : socket_(std::move(socket))
    , server_(server)
    , parser_(network::HttpMessageParser::Kind::Request) {
}

void FakeApiServer::Connection::start() {
    do_read();
}

void FakeApiServer::Connection::do_read() {
    auto self = shared_from_this();
    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Fake API read error: {}", ec.message());
                }
                return;
            }

            auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
            if (parsed.is_error()) {
                do_write(text_response(400, parsed.error().message));
                return;
            }
            if (!parsed.value()) {
                do_read();
                return;
            }
            do_write(server_.dispatch(parser_.get_request()));
        });
}

void FakeApiServer::Connection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();
    auto data = std::make_shared<std::vector<uint8_t>>(response.serialize());
    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, size_t) {
            if (ec && ec != asio::error::operation_aborted) {
                spdlog::debug("Fake API write error: {}", ec.message());
            }
            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        });
}

// ──────────────────────────────────────────────────────────
// FakeApiServer
// ──────────────────────────────────────────────────────────

FakeApiServer::FakeApiServer()
    : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    do_accept();
    thread_ = std::thread([this]() { io_.run(); });
}

FakeApiServer::~FakeApiServer() {
    stop();
}

void FakeApiServer::stop() {
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

void FakeApiServer::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::error("Fake API accept error: {}", ec.message());
            }
            return;
        }
        std::make_shared<Connection>(std::move(socket), *this)->start();
        do_accept();
    });
}

void FakeApiServer::on(HttpMethod method, const std::string& path, RouteHandler handler) {
    std::lock_guard lock(mutex_);
    routes_.push_back(Route{method, path, false, std::move(handler)});
}

void FakeApiServer::on_prefix(HttpMethod method, const std::string& prefix, RouteHandler handler) {
    std::lock_guard lock(mutex_);
    routes_.push_back(Route{method, prefix, true, std::move(handler)});
}

void FakeApiServer::serve_health() {
    on(HttpMethod::GET, "/api/health", [](const HttpRequest&) {
        return json_response(200, {{"status", "healthy"}});
    });
}

std::string FakeApiServer::base_url() const {
    return url("/api");
}

std::string FakeApiServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

HttpResponse FakeApiServer::dispatch(const HttpRequest& request) {
    RouteHandler handler;
    {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);

        const std::string path = request.path();
        // Later registrations win, so a test can override a default route
        for (auto it = routes_.rbegin(); it != routes_.rend(); ++it) {
            const bool matches = it->prefix ? path.rfind(it->path, 0) == 0 : path == it->path;
            if (it->method == request.method && matches) {
                handler = it->handler;
                break;
            }
        }
    }

    if (!handler) {
        return text_response(404, "no route for " + request.path());
    }
    try {
        return handler(request);
    } catch (const std::exception& e) {
        spdlog::error("Fake API handler threw: {}", e.what());
        return text_response(500, e.what());
    }
}

std::vector<HttpRequest> FakeApiServer::requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
}

std::vector<HttpRequest> FakeApiServer::requests_to(const std::string& path) const {
    std::lock_guard lock(mutex_);
    std::vector<HttpRequest> matching;
    for (const auto& request : requests_) {
        if (request.path() == path) {
            matching.push_back(request);
        }
    }
    return matching;
}

std::size_t FakeApiServer::count(HttpMethod method, const std::string& path) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& request : requests_) {
        if (request.method == method && request.path() == path) {
            ++n;
        }
    }
    return n;
}

HttpResponse FakeApiServer::json_response(int status, const nlohmann::json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse FakeApiServer::text_response(int status, const std::string& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain");
    response.set_body(body);
    return response;
}

} // namespace ingest::testing
