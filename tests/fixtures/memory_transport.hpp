#ifndef APISRV_TEST_MEMORY_TRANSPORT_HPP
#define APISRV_TEST_MEMORY_TRANSPORT_HPP

#include <apisrv/http/server/api_server.hpp>
#include <apisrv/http/server/transport.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace apisrv::http::test {

struct body_chunk {
    std::string data;
    std::chrono::milliseconds delay{0};
};

// Body stream delivering scripted chunks, optionally after a delay
class memory_body_stream : public body_stream {
public:
    memory_body_stream(boost::asio::io_context& io, std::vector<body_chunk> chunks, bool end_of_stream = true)
        : io_(io), chunks_(chunks.begin(), chunks.end()), end_of_stream_(end_of_stream) {}

    awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) override {
        ++reads;
        if (destroyed || cancelled) {
            throw boost::system::system_error(boost::asio::error::operation_aborted);
        }

        if (chunks_.empty()) {
            if (fail_at_end) {
                throw boost::system::system_error(boost::asio::error::connection_reset);
            }
            if (end_of_stream_) {
                co_return 0;
            }
            // a client that stops sending without closing
            co_await wait(std::chrono::hours(1));
            throw boost::system::system_error(boost::asio::error::timed_out);
        }

        auto& chunk = chunks_.front();
        if (chunk.delay.count() > 0) {
            auto delay = chunk.delay;
            chunk.delay = std::chrono::milliseconds(0);
            co_await wait(delay);
        }

        size_t size = std::min(max_size, chunk.data.size());
        std::memcpy(buffer, chunk.data.data(), size);
        chunk.data.erase(0, size);
        if (chunk.data.empty()) {
            chunks_.pop_front();
        }
        bytes_read += size;
        co_return size;
    }

    void cancel() override {
        cancelled = true;
        if (timer_) timer_->cancel();
    }

    void destroy() override {
        destroyed = true;
        if (timer_) timer_->cancel();
    }

    bool fail_at_end = false;
    bool cancelled = false;
    bool destroyed = false;
    size_t reads = 0;
    size_t bytes_read = 0;

private:
    awaitable<void> wait(std::chrono::milliseconds delay) {
        timer_ = std::make_unique<boost::asio::steady_timer>(io_, delay);
        co_await timer_->async_wait(use_awaitable);
    }

    boost::asio::io_context& io_;
    std::deque<body_chunk> chunks_;
    bool end_of_stream_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

// Sink recording every response written by the server
class memory_sink : public response_sink {
public:
    void write(std::shared_ptr<http_response> response) override {
        responses.push_back(std::move(response));
    }

    size_t count() const { return responses.size(); }

    const http_response& last() const {
        REQUIRE_FALSE(responses.empty());
        return *responses.back();
    }

    int status() const { return last().get_status_code(); }

    nlohmann::json json() const { return nlohmann::json::parse(last().get_content()); }

    std::vector<std::shared_ptr<http_response>> responses;
};

class memory_connection : public connection {
public:
    void destroy() override { destroyed = true; }
    bool destroyed = false;
};

inline std::shared_ptr<http_request> make_request(const std::string& method,
                                                  const std::string& uri,
                                                  std::vector<std::pair<std::string, std::string>> headers = {}) {
    auto request = std::make_shared<http_request>(method, uri);
    for (auto& [key, value] : headers) {
        request->add_header(key, value);
    }
    return request;
}

// Drives api_server::handle on a private io_context
struct api_server_fixture {
    boost::asio::io_context io;
    api_server server;

    api_server_fixture() = default;
    explicit api_server_fixture(server_options options) : server(options) {}
    api_server_fixture(server_options options, const api_server::handler_table& handlers) : server(options, handlers) {}

    std::shared_ptr<memory_body_stream> stream(std::vector<body_chunk> chunks = {}, bool end_of_stream = true) {
        return std::make_shared<memory_body_stream>(io, std::move(chunks), end_of_stream);
    }

    std::shared_ptr<memory_sink> perform(std::shared_ptr<http_request> request, std::shared_ptr<memory_body_stream> body) {
        auto sink = std::make_shared<memory_sink>();
        co_spawn(io, server.handle(std::move(request), std::move(body), sink), [](std::exception_ptr e) {
            if (e) std::rethrow_exception(e);
        });
        io.restart();
        io.run();
        return sink;
    }

    // request with a complete body and a matching Content-Length
    std::shared_ptr<memory_sink> perform(const std::string& method,
                                         const std::string& uri,
                                         const std::string& body = "",
                                         const std::string& content_type = "") {
        std::vector<std::pair<std::string, std::string>> headers;
        if (!content_type.empty()) headers.emplace_back("Content-Type", content_type);
        if (!body.empty()) headers.emplace_back("Content-Length", std::to_string(body.size()));
        std::vector<body_chunk> chunks;
        if (!body.empty()) chunks.push_back({body});
        return perform(make_request(method, uri, headers), stream(chunks));
    }

    std::shared_ptr<memory_sink> post_json(const std::string& uri, const nlohmann::json& body) {
        return perform("POST", uri, body.dump(), "application/json");
    }
};

} // namespace apisrv::http::test

#endif // APISRV_TEST_MEMORY_TRANSPORT_HPP
