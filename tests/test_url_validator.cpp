#include <catch2/catch_test_macros.hpp>
#include "security/url_validator.hpp"

#include <string>

using namespace urlrelay;

TEST_CASE("UrlValidator: http and https accepted", "[url]") {
    UrlValidator validator;

    auto r = validator.validate("https://example.com/path?q=1#frag");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "https://example.com/path?q=1#frag");

    CHECK(validator.validate("http://localhost:8080/").is_ok());
    CHECK(validator.validate("HTTPS://EXAMPLE.COM").is_ok());
    CHECK(validator.validate("https://user:pw@example.com/").is_ok());
    CHECK(validator.validate("http://[::1]:3000/x").is_ok());
    CHECK(validator.validate("https://b\xC3\xBC" "cher.de/").is_ok());
}

TEST_CASE("UrlValidator: surrounding whitespace is trimmed", "[url]") {
    UrlValidator validator;
    auto r = validator.validate("  https://example.com/  \n");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "https://example.com/");
}

TEST_CASE("UrlValidator: empty URL reported as missing", "[url]") {
    UrlValidator validator;
    auto r = validator.validate("   ");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::MALFORMED_REQUEST);
    CHECK(r.error_message() == "Missing 'url'");
}

TEST_CASE("UrlValidator: disallowed schemes rejected", "[url]") {
    UrlValidator validator;
    for (const char* url : {"file:///etc/passwd", "javascript:alert(1)", "data:text/html,hi",
                            "ftp://example.com/", "example.com", "://nohost", "1http://x"}) {
        INFO(url);
        auto r = validator.validate(url);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::MALFORMED_REQUEST);
        CHECK(r.error_message() == "Only http/https URLs are permitted");
    }
}

TEST_CASE("UrlValidator: embedded whitespace and control characters rejected", "[url]") {
    UrlValidator validator;
    for (const char* url : {"https://example.com/a b", "https://example.com/\tx",
                            "https://example.com/\x7f", "https://exa\nmple.com"}) {
        INFO(url);
        auto r = validator.validate(url);
        REQUIRE(r.is_error());
        CHECK(r.error_message() == "URL contains whitespace or control characters");
    }
}

TEST_CASE("UrlValidator: missing or malformed host rejected", "[url]") {
    UrlValidator validator;

    auto no_slashes = validator.validate("https:example.com");
    REQUIRE(no_slashes.is_error());
    CHECK(no_slashes.error_message() == "URL must have the form scheme://host/...");

    for (const char* url : {"https://", "https:///path", "http://exa mple", "http://host:99999/",
                            "http://host:abc/", "http://[::1/", "http://user@/", "http://ex<ample>.com/"}) {
        INFO(url);
        auto r = validator.validate(url);
        REQUIRE(r.is_error());
    }
    CHECK(validator.validate("https:///path").error_message() == "URL has an invalid host");
}

TEST_CASE("UrlValidator: length limit enforced", "[url]") {
    UrlValidator::Config cfg;
    cfg.max_length = 32;
    UrlValidator validator(cfg);

    CHECK(validator.validate("https://example.com/").is_ok());
    auto r = validator.validate("https://example.com/" + std::string(40, 'a'));
    REQUIRE(r.is_error());
    CHECK(r.error_message() == "URL too long: max 32 bytes");
}

TEST_CASE("UrlValidator: custom scheme list is case-insensitive", "[url]") {
    UrlValidator::Config cfg;
    cfg.allowed_schemes = {"HTTPS", "mailto"};
    UrlValidator validator(cfg);

    CHECK(validator.validate("https://example.com").is_ok());
    CHECK(validator.validate("mailto:someone@example.com").is_ok());
    CHECK(validator.validate("http://example.com").is_error());

    auto empty = validator.validate("mailto:");
    REQUIRE(empty.is_error());
    CHECK(empty.error_message() == "URL has no content after the scheme");
}

TEST_CASE("UrlValidator: extract_scheme", "[url]") {
    CHECK(UrlValidator::extract_scheme("HTTPS://x") == "https");
    CHECK(UrlValidator::extract_scheme("svn+ssh://x") == "svn+ssh");
    CHECK(UrlValidator::extract_scheme("no-colon").empty());
    CHECK(UrlValidator::extract_scheme(":x").empty());
    CHECK(UrlValidator::extract_scheme("1abc:x").empty());
    CHECK(UrlValidator::extract_scheme("a b:x").empty());
}
