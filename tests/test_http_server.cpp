#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "server/request_pipeline.hpp"
#include "server/shutdown_coordinator.hpp"
#include "mocks/mock_url_opener.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

using namespace urlrelay;
using urlrelay::testing::RecordingUrlOpener;

namespace {

constexpr const char* kToken = "integration-token";

RelayConfig loopback_config(std::vector<std::string> subnets = {"127.0.0.0/8"}) {
    RelayConfig cfg;
    cfg.server.host = "127.0.0.1";
    cfg.server.port = 0;  // ephemeral
    cfg.server.thread_pool_size = 2;
    cfg.server.max_body_bytes = 1024;
    cfg.security.token = kToken;
    cfg.security.allowed_subnets = std::move(subnets);
    return cfg;
}

/// Listener on an ephemeral loopback port, stopped and joined on scope exit.
class RunningServer {
public:
    explicit RunningServer(const RelayConfig& cfg,
                           std::shared_ptr<RecordingUrlOpener> opener = std::make_shared<RecordingUrlOpener>(),
                           ShutdownCoordinator::Config shutdown_config = {})
        : opener_(std::move(opener)),
          coordinator_(std::make_shared<ShutdownCoordinator>(shutdown_config)),
          server_(RequestPipeline::build(cfg, opener_), cfg.server, coordinator_) {
        port_ = server_.bind();
        thread_ = std::thread([this] { server_.run(); });
        server_.wait_until_ready();
    }

    ~RunningServer() {
        server_.stop();
        thread_.join();
    }

    RunningServer(const RunningServer&) = delete;
    RunningServer& operator=(const RunningServer&) = delete;

    [[nodiscard]] httplib::Client client() const {
        httplib::Client cli("127.0.0.1", port_);
        cli.set_connection_timeout(std::chrono::seconds(2));
        cli.set_read_timeout(std::chrono::seconds(5));
        return cli;
    }

    RecordingUrlOpener& opener() { return *opener_; }
    ShutdownCoordinator& coordinator() { return *coordinator_; }
    HttpServer& server() { return server_; }
    [[nodiscard]] int port() const { return port_; }

private:
    std::shared_ptr<RecordingUrlOpener> opener_;
    std::shared_ptr<ShutdownCoordinator> coordinator_;
    HttpServer server_;
    std::thread thread_;
    int port_ = 0;
};

httplib::Headers auth_headers(const std::string& token = kToken) {
    return {{"X-Auth-Token", token}};
}

/// Bare TCP client for sending a request a few bytes at a time.
class RawConnection {
public:
    explicit RawConnection(int port) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = fd_ >= 0 &&
            ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }
    ~RawConnection() { if (fd_ >= 0) ::close(fd_); }

    RawConnection(const RawConnection&) = delete;
    RawConnection& operator=(const RawConnection&) = delete;

    [[nodiscard]] bool connected() const { return connected_; }

    bool send(std::string_view data) {
        return ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL) ==
               static_cast<ssize_t>(data.size());
    }

    /// True once the server has closed or reset the connection; waits up to @p timeout
    bool closed_by_peer(std::chrono::milliseconds timeout) {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) return false;
        char buf[512];
        while (true) {
            const ssize_t n = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
            if (n == 0) return true;
            if (n < 0) return errno != EAGAIN && errno != EWOULDBLOCK;
        }
    }

private:
    int fd_;
    bool connected_ = false;
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

/// Posts an open on its own connection and thread
std::future<httplib::Result> post_open_async(int port, std::string url) {
    return std::async(std::launch::async, [port, url = std::move(url)] {
        httplib::Client cli("127.0.0.1", port);
        cli.set_read_timeout(std::chrono::seconds(5));
        return cli.Post("/open", auth_headers(), R"({"url":")" + url + R"("})", "application/json");
    });
}

} // anonymous namespace

TEST_CASE("HttpServer: binds an ephemeral port", "[http]") {
    RunningServer server(loopback_config());
    CHECK(server.port() > 0);
}

TEST_CASE("HttpServer: ping with token", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto res = cli.Get("/ping", auth_headers());
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->get_header_value("Content-Type").find("application/json") == 0);
    CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");
    const auto body = nlohmann::json::parse(res->body);
    CHECK(body["ok"] == true);
    CHECK(body["service"] == "url-relay");
    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: missing or wrong token is 401", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto missing = cli.Get("/ping");
    REQUIRE(missing);
    CHECK(missing->status == 401);
    CHECK(nlohmann::json::parse(missing->body)["ok"] == false);

    auto wrong = cli.Post("/open", auth_headers("wrong"),
                          R"({"url":"https://example.com"})", "application/json");
    REQUIRE(wrong);
    CHECK(wrong->status == 401);
    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: open dispatches the URL once", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto res = cli.Post("/open", auth_headers(),
                        R"({"url":"https://example.com/page?x=1"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(nlohmann::json::parse(res->body)["ok"] == true);
    REQUIRE(server.opener().open_count() == 1);
    CHECK(server.opener().urls()[0] == "https://example.com/page?x=1");
}

TEST_CASE("HttpServer: legacy token header is accepted", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    const httplib::Headers headers = {{"X-OpenInSafari-Token", kToken}};
    auto res = cli.Post("/open", headers, R"({"url":"https://example.com"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(server.opener().open_count() == 1);
}

TEST_CASE("HttpServer: form-encoded open body", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto res = cli.Post("/open", auth_headers(), "url=https%3A%2F%2Fexample.com%2Fform",
                        "application/x-www-form-urlencoded");
    REQUIRE(res);
    CHECK(res->status == 200);
    REQUIRE(server.opener().open_count() == 1);
    CHECK(server.opener().urls()[0] == "https://example.com/form");
}

TEST_CASE("HttpServer: malformed bodies and URLs are 400", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto bad_json = cli.Post("/open", auth_headers(), "{not json", "application/json");
    REQUIRE(bad_json);
    CHECK(bad_json->status == 400);
    CHECK(nlohmann::json::parse(bad_json->body)["error"] == "Invalid JSON body");

    auto bad_scheme = cli.Post("/open", auth_headers(),
                               R"({"url":"file:///etc/passwd"})", "application/json");
    REQUIRE(bad_scheme);
    CHECK(bad_scheme->status == 400);

    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: oversized body is 413", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    const std::string url = "https://example.com/" + std::string(2000, 'a');
    auto res = cli.Post("/open", auth_headers(), R"({"url":")" + url + R"("})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 413);
    CHECK(nlohmann::json::parse(res->body)["ok"] == false);
    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: unknown path is 404", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto res = cli.Get("/nope", auth_headers());
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(nlohmann::json::parse(res->body)["error"] == "Not Found");

    auto wrong_method = cli.Get("/open", auth_headers());
    REQUIRE(wrong_method);
    CHECK(wrong_method->status == 404);
}

TEST_CASE("HttpServer: other methods go through auth before their 404", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto no_token = cli.Put("/open", R"({"url":"https://example.com"})", "application/json");
    REQUIRE(no_token);
    CHECK(no_token->status == 401);

    auto put = cli.Put("/open", auth_headers(), R"({"url":"https://example.com"})", "application/json");
    REQUIRE(put);
    CHECK(put->status == 404);

    auto patch = cli.Patch("/open", auth_headers(), "{}", "application/json");
    REQUIRE(patch);
    CHECK(patch->status == 404);

    auto del = cli.Delete("/open", auth_headers());
    REQUIRE(del);
    CHECK(del->status == 404);
    CHECK(nlohmann::json::parse(del->body)["error"] == "Not Found");

    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: CORS preflight needs no token", "[http]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    auto res = cli.Options("/open", httplib::Headers{});
    REQUIRE(res);
    CHECK(res->status == 204);
    CHECK(res->get_header_value("Access-Control-Allow-Methods").find("POST") != std::string::npos);
    CHECK(res->get_header_value("Access-Control-Allow-Headers").find("X-Auth-Token") != std::string::npos);
}

TEST_CASE("HttpServer: client outside the allowed ranges is 403", "[http]") {
    RunningServer server(loopback_config({"10.211.55.0/24"}));
    auto cli = server.client();

    auto res = cli.Post("/open", auth_headers(),
                        R"({"url":"https://example.com"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 403);
    CHECK(nlohmann::json::parse(res->body)["ok"] == false);
    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: launcher failure is 502", "[http]") {
    RunningServer server(loopback_config(), std::make_shared<RecordingUrlOpener>(/*should_succeed=*/false));
    auto cli = server.client();

    auto res = cli.Post("/open", auth_headers(),
                        R"({"url":"https://example.com"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 502);
    CHECK(nlohmann::json::parse(res->body)["error"] == "Mock launcher failure");
}

TEST_CASE("HttpServer: requests after shutdown starts are 503", "[http][shutdown]") {
    RunningServer server(loopback_config());
    auto cli = server.client();

    server.coordinator().request_shutdown();
    auto res = cli.Post("/open", auth_headers(),
                        R"({"url":"https://example.com"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 503);
    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: bind failure throws", "[http]") {
    auto cfg = loopback_config();
    cfg.server.host = "192.0.2.1";  // TEST-NET-1, never a local address
    cfg.server.port = 51999;
    auto pipeline = RequestPipeline::build(cfg, std::make_shared<RecordingUrlOpener>());
    HttpServer server(pipeline, cfg.server, std::make_shared<ShutdownCoordinator>());
    CHECK_THROWS_AS(server.bind(), std::runtime_error);
}

TEST_CASE("HttpServer: run before bind is a logic error", "[http]") {
    const auto cfg = loopback_config();
    auto pipeline = RequestPipeline::build(cfg, std::make_shared<RecordingUrlOpener>());
    HttpServer server(pipeline, cfg.server, std::make_shared<ShutdownCoordinator>());
    CHECK_THROWS_AS(server.run(), std::logic_error);
}

// ============================================================================
// Shutdown and slow clients
// ============================================================================

TEST_CASE("HttpServer: open in flight when shutdown starts still succeeds", "[http][shutdown]") {
    RunningServer server(loopback_config(),
                         std::make_shared<RecordingUrlOpener>(true, std::chrono::milliseconds(500)));

    auto pending = post_open_async(server.port(), "https://example.com/slow");
    REQUIRE(eventually([&] { return server.coordinator().in_flight_count() == 1; }));

    CHECK(server.server().shutdown());
    auto res = pending.get();
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(server.opener().open_count() == 1);
}

TEST_CASE("HttpServer: shutdown gives up once the grace period is spent", "[http][shutdown]") {
    ShutdownCoordinator::Config shutdown_config;
    shutdown_config.grace_period = std::chrono::milliseconds(200);
    RunningServer server(loopback_config(),
                         std::make_shared<RecordingUrlOpener>(true, std::chrono::milliseconds(1500)),
                         shutdown_config);

    auto pending = post_open_async(server.port(), "https://example.com/stuck");
    REQUIRE(eventually([&] { return server.coordinator().in_flight_count() == 1; }));

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(server.server().shutdown());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1000));

    // Abandoned, not killed: the handler still answers
    auto res = pending.get();
    REQUIRE(res);
    CHECK(res->status == 200);
}

TEST_CASE("HttpServer: shutdown cuts a request that is still being sent", "[http][shutdown]") {
    auto cfg = loopback_config();
    cfg.server.read_timeout = std::chrono::milliseconds(10000);
    RunningServer server(cfg);

    RawConnection stalled(server.port());
    REQUIRE(stalled.connected());
    REQUIRE(stalled.send("POST /open HTTP/1.1\r\nHost: 127.0.0.1\r\n"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto start = std::chrono::steady_clock::now();
    CHECK(server.server().shutdown());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));
    CHECK(stalled.closed_by_peer(std::chrono::milliseconds(1000)));
    CHECK(server.opener().open_count() == 0);
}

TEST_CASE("HttpServer: request sent too slowly is cut at the read deadline", "[http]") {
    auto cfg = loopback_config();
    cfg.server.read_timeout = std::chrono::milliseconds(300);
    RunningServer server(cfg);

    RawConnection slow(server.port());
    REQUIRE(slow.connected());
    REQUIRE(slow.send("POST /open HTTP/1.1\r\nHost: 127.0.0.1\r\n"));

    // One header line every 100 ms keeps each recv() inside the socket timeout
    const auto start = std::chrono::steady_clock::now();
    bool cut = false;
    while (std::chrono::steady_clock::now() - start < std::chrono::seconds(3)) {
        if (!slow.send("X-Pad: 1\r\n") || slow.closed_by_peer(std::chrono::milliseconds(100))) {
            cut = true;
            break;
        }
    }
    CHECK(cut);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));

    auto cli = server.client();
    auto res = cli.Get("/ping", auth_headers());
    REQUIRE(res);
    CHECK(res->status == 200);
}

TEST_CASE("HttpServer: stop before run makes run return at once", "[http][shutdown]") {
    const auto cfg = loopback_config();
    auto pipeline = RequestPipeline::build(cfg, std::make_shared<RecordingUrlOpener>());
    HttpServer server(pipeline, cfg.server, std::make_shared<ShutdownCoordinator>());
    server.bind();
    server.stop();

    const auto start = std::chrono::steady_clock::now();
    CHECK(server.run());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1000));
}
