#include <catch2/catch_test_macros.hpp>
#include "server/request_router.hpp"
#include "mocks/mock_url_opener.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace urlrelay;
using urlrelay::testing::RecordingUrlOpener;

namespace {

InboundRequest open_request(std::optional<std::string> url) {
    InboundRequest req;
    req.operation = Operation::OPEN;
    req.url = std::move(url);
    req.source_address = "10.211.55.3";
    return req;
}

} // anonymous namespace

TEST_CASE("RequestRouter: requires an opener", "[router]") {
    CHECK_THROWS_AS(RequestRouter(nullptr, UrlValidator()), std::invalid_argument);
}

TEST_CASE("RequestRouter: ping reports service and never opens", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>();
    RequestRouter router(opener, UrlValidator());

    InboundRequest req;
    req.operation = Operation::PING;
    const auto res = router.route(req);

    CHECK(res.status == 200);
    CHECK(res.ok());
    const auto body = nlohmann::json::parse(res.body);
    CHECK(body["ok"] == true);
    CHECK(body["service"] == "url-relay");
    CHECK(body.contains("version"));
    CHECK(opener->open_count() == 0);
}

TEST_CASE("RequestRouter: valid open dispatches exactly once", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>();
    RequestRouter router(opener, UrlValidator());

    const auto res = router.route(open_request(" https://example.com/x "));

    REQUIRE(res.status == 200);
    const auto body = nlohmann::json::parse(res.body);
    CHECK(body["ok"] == true);
    CHECK(body["url"] == "https://example.com/x");
    CHECK(body["opener"] == "recording");
    REQUIRE(opener->open_count() == 1);
    CHECK(opener->urls()[0] == "https://example.com/x");
}

TEST_CASE("RequestRouter: parse error reported without opening", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>();
    RequestRouter router(opener, UrlValidator());

    auto req = open_request(std::nullopt);
    req.parse_error = "Invalid JSON body";
    const auto res = router.route(req);

    CHECK(res.status == 400);
    CHECK(res.category == ErrorCategory::MALFORMED_REQUEST);
    CHECK(nlohmann::json::parse(res.body)["error"] == "Invalid JSON body");
    CHECK(opener->open_count() == 0);
}

TEST_CASE("RequestRouter: missing url is a 400", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>();
    RequestRouter router(opener, UrlValidator());

    const auto res = router.route(open_request(std::nullopt));
    CHECK(res.status == 400);
    CHECK(nlohmann::json::parse(res.body)["error"] == "Missing 'url'");
    CHECK(opener->open_count() == 0);
}

TEST_CASE("RequestRouter: disallowed scheme is a 400", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>();
    RequestRouter router(opener, UrlValidator());

    const auto res = router.route(open_request("file:///etc/passwd"));
    CHECK(res.status == 400);
    const auto body = nlohmann::json::parse(res.body);
    CHECK(body["ok"] == false);
    CHECK(body["error"] == "Only http/https URLs are permitted");
    CHECK(opener->open_count() == 0);
}

TEST_CASE("RequestRouter: launcher failure is a 502 with detail", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>(false);
    RequestRouter router(opener, UrlValidator());

    const auto res = router.route(open_request("https://example.com"));
    CHECK(res.status == 502);
    CHECK(res.category == ErrorCategory::OPEN_FAILURE);
    CHECK(nlohmann::json::parse(res.body)["error"] == "Mock launcher failure");
    CHECK(opener->open_count() == 1);
}

TEST_CASE("RequestRouter: unknown operation is a 404", "[router]") {
    auto opener = std::make_shared<RecordingUrlOpener>();
    RequestRouter router(opener, UrlValidator());

    InboundRequest req;
    req.operation = Operation::UNKNOWN;
    const auto res = router.route(req);
    CHECK(res.status == 404);
    CHECK(nlohmann::json::parse(res.body)["ok"] == false);
    CHECK(opener->open_count() == 0);
}
