#include <catch2/catch_test_macros.hpp>
#include <apisrv/api_server.hpp>
#include "fixtures/memory_transport.hpp"
#include <stdexcept>

using namespace apisrv::http;
using namespace apisrv::http::test;

namespace {

    bool upgrade(api_server& server, const std::shared_ptr<http_request>& request,
                 const std::shared_ptr<memory_connection>& socket, const std::string& head = "") {
        boost::asio::io_context io;
        bool result = false;
        apisrv::co_spawn(io, server.handle_upgrade(request, socket, head), [&result](std::exception_ptr e, bool accepted) {
            if (e) std::rethrow_exception(e);
            result = accepted;
        });
        io.run();
        return result;
    }

}

TEST_CASE("API server protocol upgrades", "[api_server][upgrade][integration]") {
    api_server server;
    auto socket = std::make_shared<memory_connection>();
    auto request = make_request("GET", "/ws?room=lobby", {{"Upgrade", "websocket"}, {"Authorization", "Bearer good"}});

    nlohmann::json seen_params;
    std::string seen_head;
    std::shared_ptr<connection> seen_socket;

    server.set_upgrade_handler([&](request_context& ctx, std::shared_ptr<connection> raw, const std::string& head) {
        seen_params = ctx.params;
        seen_head = head;
        seen_socket = raw;
        return true;
    });

    SECTION("Upgrade handler receives the raw connection") {
        REQUIRE(upgrade(server, request, socket, "\x81\x05"));
        REQUIRE(seen_params == nlohmann::json{{"room", "lobby"}});
        REQUIRE(seen_head == "\x81\x05");
        REQUIRE(seen_socket == socket);
        REQUIRE_FALSE(socket->destroyed);
    }

    SECTION("Authentication runs first") {
        server.set_auth_handler([](request_context& ctx, response&) {
            return ctx.header("Authorization") == "Bearer good";
        });
        REQUIRE(upgrade(server, request, socket));

        auto anonymous = make_request("GET", "/ws");
        REQUIRE_FALSE(upgrade(server, anonymous, socket));
        REQUIRE(socket->destroyed);
    }

    SECTION("Failures destroy the connection") {
        server.set_upgrade_handler([](request_context&, std::shared_ptr<connection>, const std::string&) -> bool {
            throw std::runtime_error("handshake failed");
        });
        REQUIRE_FALSE(upgrade(server, request, socket));
        REQUIRE(socket->destroyed);
    }

    SECTION("Failures not derived from std::exception destroy the connection") {
        server.set_upgrade_handler([](request_context&, std::shared_ptr<connection>, const std::string&) -> bool {
            throw 42;
        });
        REQUIRE_FALSE(upgrade(server, request, socket));
        REQUIRE(socket->destroyed);
    }

    SECTION("Without upgrade handler the connection is destroyed") {
        api_server plain;
        REQUIRE_FALSE(upgrade(plain, request, socket));
        REQUIRE(socket->destroyed);
    }
}
