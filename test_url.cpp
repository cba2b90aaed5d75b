// Unit tests for URL helpers

#include <catch2/catch.hpp>

#include <stdexcept>

#include "url.hpp"

using namespace page_recorder;

TEST_CASE("parseUrl splits scheme, host, port and path", "[url]") {
    SECTION("https with default port") {
        auto u = parseUrl("https://project.example.co/storage");
        CHECK(u.protocol == "https");
        CHECK(u.host == "project.example.co");
        CHECK(u.port == 443);
        CHECK(u.path == "/storage");
        CHECK(u.use_ssl);
        CHECK(u.hostHeader() == "project.example.co");
    }
    SECTION("explicit port and query") {
        auto u = parseUrl("http://127.0.0.1:9222/json/list?x=1");
        CHECK(u.protocol == "http");
        CHECK(u.host == "127.0.0.1");
        CHECK(u.port == 9222);
        CHECK(u.path == "/json/list?x=1");
        CHECK_FALSE(u.use_ssl);
        CHECK(u.hostHeader() == "127.0.0.1:9222");
    }
    SECTION("devtools websocket URL") {
        auto u = parseUrl("ws://127.0.0.1:9222/devtools/page/ABC");
        CHECK(u.protocol == "ws");
        CHECK(u.port == 9222);
        CHECK(u.path == "/devtools/page/ABC");
    }
    SECTION("no path") {
        auto u = parseUrl("https://example.org");
        CHECK(u.path == "/");
    }
    SECTION("scheme is case-insensitive") {
        auto u = parseUrl("HTTPS://example.org");
        CHECK(u.protocol == "https");
        CHECK(u.use_ssl);
    }
}

TEST_CASE("parseUrl rejects broken URLs", "[url]") {
    CHECK_THROWS_AS(parseUrl("https:///path"), std::invalid_argument);
    CHECK_THROWS_AS(parseUrl("http://host:abc/"), std::invalid_argument);
    CHECK_THROWS_AS(parseUrl("http://host:70000/"), std::invalid_argument);
    CHECK_THROWS_AS(parseUrl("http://host:/"), std::invalid_argument);
}

TEST_CASE("encodePath keeps unreserved characters and slashes", "[url]") {
    CHECK(encodePath("recordings/v1.mp4") == "recordings/v1.mp4");
    CHECK(encodePath("a b") == "a%20b");
    CHECK(encodePath("x?y&z") == "x%3Fy%26z");
    CHECK(encodePath("under_score-dash~") == "under_score-dash~");
}
