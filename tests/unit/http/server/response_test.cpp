#include <catch2/catch_test_macros.hpp>
#include <apisrv/http/server/response.hpp>
#include "fixtures/memory_transport.hpp"

using namespace apisrv::http;
using apisrv::http::test::memory_sink;

TEST_CASE("Response JSON helper", "[response][unit]") {
    auto sink = std::make_shared<memory_sink>();

    SECTION("Defaults to 200 with no-cache headers") {
        response res(sink);
        res.json({{"hello", "world"}});

        REQUIRE(sink->count() == 1);
        const auto& out = sink->last();
        REQUIRE(out.get_status_code() == 200);
        REQUIRE(out.get_header("Content-Type") == "application/json; charset=utf-8");
        REQUIRE(out.get_header("Cache-Control") == "no-store, no-cache, must-revalidate, post-check=0, pre-check=0");
        REQUIRE(out.get_header("Expires") == "Wed, 01 Jan 2020 12:00:00 GMT");
        REQUIRE(out.get_header("Pragma") == "no-cache");
        REQUIRE(out.get_content() == R"({"hello":"world"})");
        REQUIRE(res.has_responded());
    }

    SECTION("Custom status without cache headers") {
        response res(sink);
        res.json(nlohmann::json::array({1, 2}), http_response::status::created, false);

        const auto& out = sink->last();
        REQUIRE(out.get_status_code() == 201);
        REQUIRE_FALSE(out.has_header("Cache-Control"));
        REQUIRE_FALSE(out.has_header("Pragma"));
        REQUIRE(out.get_content() == "[1,2]");
    }

    SECTION("Pretty printing") {
        response res(sink, true);
        REQUIRE(res.is_pretty_json());
        res.json({{"a", 1}});
        REQUIRE(sink->last().get_content() == "{\n  \"a\": 1\n}\n");
    }
}

TEST_CASE("Response other writers", "[response][unit]") {
    auto sink = std::make_shared<memory_sink>();
    response res(sink);

    SECTION("Text response") {
        res.send("pong");
        REQUIRE(sink->last().get_content() == "pong");
        REQUIRE(sink->last().get_header("Content-Type") == "text/plain");
    }

    SECTION("Status and headers before sending") {
        res.status(http_response::status::accepted);
        res.header("X-Request", "1");
        res.send("<p>ok</p>", "text/html");
        REQUIRE(sink->last().get_status_code() == 202);
        REQUIRE(sink->last().get_header("X-Request") == "1");
        REQUIRE(sink->last().get_header("Content-Type") == "text/html");
    }

    SECTION("Prepared response") {
        auto prepared = std::make_shared<http_response>();
        prepared->set_status(http_response::status::no_content);
        res.send_response(prepared);
        REQUIRE(sink->responses.front() == prepared);
    }

    SECTION("Error response") {
        res.error(http_response::status::bad_request, "Missing token.");
        REQUIRE(sink->status() == 400);
        REQUIRE(sink->json() == nlohmann::json{{"code", 400}, {"message", "Bad Request (Missing token)"}});
    }
}

TEST_CASE("Response is sent at most once", "[response][unit]") {
    auto sink = std::make_shared<memory_sink>();
    response res(sink);
    res.json({{"first", true}});

    REQUIRE_THROWS_AS(res.json({{"second", true}}), std::runtime_error);
    REQUIRE_THROWS_AS(res.send("again"), std::runtime_error);
    REQUIRE_THROWS_AS(res.error(http_response::status::internal_server_error), std::runtime_error);
    REQUIRE_THROWS_AS(res.status(http_response::status::ok), std::runtime_error);
    REQUIRE_THROWS_AS(res.header("X", "y"), std::runtime_error);
    REQUIRE(sink->count() == 1);
    REQUIRE(sink->json() == nlohmann::json{{"first", true}});
}
