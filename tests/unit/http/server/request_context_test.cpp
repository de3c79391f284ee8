#include <catch2/catch_test_macros.hpp>
#include <apisrv/http/server/request_context.hpp>

using namespace apisrv::http;

TEST_CASE("Request context accessors", "[request_context][unit]") {
    auto request = std::make_shared<http_request>("get", "/items/1?verbose=true");
    request->add_header("Authorization", "Bearer t");
    request_context context(request);

    REQUIRE(context.get_method() == method::GET);
    REQUIRE(context.get_method_name() == "get");
    REQUIRE(context.get_uri() == "/items/1?verbose=true");
    REQUIRE(context.get_path() == "/items/1");
    REQUIRE(context.get_query() == "verbose=true");
    REQUIRE(context.header("authorization") == "Bearer t");
    REQUIRE(context.get_http_request() == request);

    SECTION("Parameters are unset until the pipeline runs") {
        REQUIRE(context.params.is_null());
        REQUIRE(context.path_params.is_null());
        REQUIRE(context.url_params.is_null());
        REQUIRE(context.body_params.is_null());
        REQUIRE_FALSE(context.has("anything"));
        REQUIRE(context["anything"].empty());
    }
}

TEST_CASE("Request context parameter merge", "[request_context][unit]") {
    request_context context(std::make_shared<http_request>("POST", "/items"));

    SECTION("Later sources override earlier ones") {
        context.assign_params({{"a", 1}}, param_source::body);
        context.assign_params({{"a", 2}}, param_source::query);
        context.assign_params({{"a", 3}}, param_source::path);

        REQUIRE(context.params["a"] == 3);
        REQUIRE(context.get_param_sources().at("a") == param_source::path);

        REQUIRE(context.get_collisions().size() == 1);
        const auto& collision = context.get_collisions().front();
        REQUIRE(collision.key == "a");
        REQUIRE(collision.sources == std::vector<param_source>{param_source::body, param_source::query, param_source::path});
    }

    SECTION("Distinct keys do not collide") {
        context.assign_params({{"a", 1}}, param_source::body);
        context.assign_params({{"b", "x"}}, param_source::query);
        context.assign_params({{"c", true}}, param_source::path);

        REQUIRE(context.params == nlohmann::json{{"a", 1}, {"b", "x"}, {"c", true}});
        REQUIRE(context.get_collisions().empty());
        REQUIRE(context["b"] == "x");
        REQUIRE(context["a"].empty());
        REQUIRE(context.has("c"));
    }

    SECTION("Only objects are merged") {
        context.assign_params(nullptr, param_source::body);
        context.assign_params(nlohmann::json::array({1}), param_source::query);
        REQUIRE(context.params.is_object());
        REQUIRE(context.params.empty());
    }

    SECTION("Source labels") {
        REQUIRE(get_param_source_label(param_source::body) == "request body");
        REQUIRE(get_param_source_label(param_source::query) == "query string");
        REQUIRE(get_param_source_label(param_source::path) == "path template");
    }

    SECTION("Debug listing names the winning sources") {
        context.assign_params({{"a", 1}}, param_source::body);
        context.assign_params({{"a", 2}}, param_source::path);
        REQUIRE(context.debug_parameters() == "a <- path template");
    }
}
