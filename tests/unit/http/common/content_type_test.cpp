#include <catch2/catch_test_macros.hpp>
#include <apisrv/http/common/content_type.hpp>

using namespace apisrv::http;

TEST_CASE("Content-Type parsing", "[content_type][unit]") {

    SECTION("Media type only") {
        auto type = content_type::parse("application/json");
        REQUIRE(type);
        REQUIRE(type->get_media_type() == "application/json");
        REQUIRE(type->get_parameters().empty());
    }

    SECTION("Media type is lowercased and trimmed") {
        auto type = content_type::parse("  Application/JSON ");
        REQUIRE(type);
        REQUIRE(type->get_media_type() == "application/json");
    }

    SECTION("Parameters are case-insensitive") {
        auto type = content_type::parse("application/json; Charset=UTF-8");
        REQUIRE(type);
        REQUIRE(type->has_parameter("charset"));
        REQUIRE(type->get_parameter("charset") == "utf-8");
    }

    SECTION("Quoted parameter values") {
        auto type = content_type::parse(R"(multipart/form-data; boundary="a;b \"c\""; charset=utf-8)");
        REQUIRE(type);
        REQUIRE(type->get_media_type() == "multipart/form-data");
        REQUIRE(type->get_parameter("boundary") == R"(a;b "c")");
        REQUIRE(type->get_parameter("charset") == "utf-8");
    }

    SECTION("Missing parameter") {
        auto type = content_type::parse("text/plain");
        REQUIRE_FALSE(type->has_parameter("charset"));
        REQUIRE(type->get_parameter("charset").empty());
    }

    SECTION("Malformed headers") {
        REQUIRE_FALSE(content_type::parse(""));
        REQUIRE_FALSE(content_type::parse("   "));
        REQUIRE_FALSE(content_type::parse("application/json; charset"));
        REQUIRE_FALSE(content_type::parse("application/json; charset="));
        REQUIRE_FALSE(content_type::parse("application/json; =utf-8"));
        REQUIRE_FALSE(content_type::parse("application/json; charset=utf 8"));
        REQUIRE_FALSE(content_type::parse(R"(application/json; charset="utf-8)"));
    }
}
