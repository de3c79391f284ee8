#include <catch2/catch_test_macros.hpp>
#include <apisrv/http/util/url.hpp>

using namespace apisrv::http::util::url;

// ============================================================================
// uri_component_decode
// ============================================================================

TEST_CASE("uri_component_decode", "[url][unit]") {
    std::string out;

    SECTION("Plain text is unchanged") {
        REQUIRE(uri_component_decode("abc123", out));
        REQUIRE(out == "abc123");
    }

    SECTION("Percent escapes are decoded") {
        REQUIRE(uri_component_decode("hello%20world%2F", out));
        REQUIRE(out == "hello world/");
    }

    SECTION("Plus sign is kept") {
        REQUIRE(uri_component_decode("a+b", out));
        REQUIRE(out == "a+b");
    }

    SECTION("Multi-byte sequences") {
        REQUIRE(uri_component_decode("caf%C3%A9", out));
        REQUIRE(out == "caf\xC3\xA9");
    }

    SECTION("Malformed escapes fail") {
        REQUIRE_FALSE(uri_component_decode("%", out));
        REQUIRE_FALSE(uri_component_decode("%4", out));
        REQUIRE_FALSE(uri_component_decode("%G1", out));
        REQUIRE_FALSE(uri_component_decode("abc%", out));
    }

    SECTION("Invalid UTF-8 fails") {
        REQUIRE_FALSE(uri_component_decode("%FF", out));
        REQUIRE_FALSE(uri_component_decode("%C3", out));
        REQUIRE_FALSE(uri_component_decode("%ED%A0%80", out));
    }
}

// ============================================================================
// form_decode
// ============================================================================

TEST_CASE("form_decode", "[url][unit]") {

    SECTION("Plus sign is a space") {
        REQUIRE(form_decode("hello+world") == "hello world");
    }

    SECTION("Escapes are decoded") {
        REQUIRE(form_decode("a%3Db%26c") == "a=b&c");
    }

    SECTION("Malformed escapes are kept verbatim") {
        REQUIRE(form_decode("100%") == "100%");
        REQUIRE(form_decode("%zz1") == "%zz1");
    }

    SECTION("Invalid UTF-8 is replaced") {
        REQUIRE(form_decode("a%FFb") == "a\xEF\xBF\xBD" "b");
        REQUIRE(form_decode("%E2%82") == "\xEF\xBF\xBD");
        REQUIRE(form_decode("%E2%82x") == "\xEF\xBF\xBD" "x");
        REQUIRE(form_decode("%C0%AF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
        REQUIRE(form_decode("%E2%82%AC") == "\xE2\x82\xAC");
    }
}

// ============================================================================
// parse_url_encoded_data / parse_url_encoded_object
// ============================================================================

TEST_CASE("URL encoded data parsing", "[url][unit]") {

    SECTION("Pairs are decoded") {
        std::multimap<std::string, std::string> store;
        parse_url_encoded_data("a=1&b=hello+world&c=%2F", store);
        REQUIRE(store.size() == 3);
        REQUIRE(store.find("b")->second == "hello world");
        REQUIRE(store.find("c")->second == "/");
    }

    SECTION("Keys without value and empty keys") {
        std::multimap<std::string, std::string> store;
        parse_url_encoded_data("flag&=skipped&&x=", store);
        REQUIRE(store.size() == 2);
        REQUIRE(store.find("flag")->second.empty());
        REQUIRE(store.find("x")->second.empty());
    }

    SECTION("Repeated keys become arrays in order") {
        auto params = parse_url_encoded_object("a=1&b=2&a=3&a=4");
        REQUIRE(params["a"] == nlohmann::json::array({"1", "3", "4"}));
        REQUIRE(params["b"] == "2");
    }

    SECTION("Empty input is an empty object") {
        auto params = parse_url_encoded_object("");
        REQUIRE(params.is_object());
        REQUIRE(params.empty());
    }
}

TEST_CASE("UTF-8 validation", "[url][unit]") {
    REQUIRE(is_valid_utf8(""));
    REQUIRE(is_valid_utf8("plain"));
    REQUIRE(is_valid_utf8("\xE2\x82\xAC"));
    REQUIRE(is_valid_utf8("\xF0\x9F\x98\x80"));
    REQUIRE_FALSE(is_valid_utf8("\xC0\xAF"));
    REQUIRE_FALSE(is_valid_utf8("\xE0\x80\xAF"));
    REQUIRE_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));
    REQUIRE_FALSE(is_valid_utf8("\x80"));
}

TEST_CASE("UTF-8 replacement", "[url][unit]") {
    REQUIRE(to_valid_utf8("plain") == "plain");
    REQUIRE(to_valid_utf8("\xF0\x9F\x98\x80") == "\xF0\x9F\x98\x80");
    REQUIRE(to_valid_utf8("\x80") == "\xEF\xBF\xBD");
    REQUIRE(to_valid_utf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    REQUIRE(to_valid_utf8("\xF0\x9F\x98") == "\xEF\xBF\xBD");
    REQUIRE(is_valid_utf8(to_valid_utf8("\xFF\xC3(")));
}
