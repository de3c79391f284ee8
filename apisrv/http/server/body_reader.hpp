#ifndef APISRV_HTTP_BODY_READER_HPP
#define APISRV_HTTP_BODY_READER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/steady_timer.hpp>
#include "../common/http_request.hpp"
#include "request_error.hpp"
#include "transport.hpp"
#include "../../util/types.hpp"

namespace apisrv::http {

/**
 * Reads the body of a single request under size and time limits.
 *
 * The reader starts in the reading state and performs exactly one transition to the
 * completed state: success at the end of the stream, or a failure raised by the header
 * checks, an oversized chunk, a transport error or the read timeout. Events arriving after
 * completion are ignored and the read timer is cancelled on completion. Failures are
 * reported once through the error handler given to read().
 */
class body_reader : public std::enable_shared_from_this<body_reader> {

    static constexpr size_t MAX_BUFFER_SIZE = 4096;

public:
    enum class state {
        reading,
        completed
    };

    using error_handler = std::function<void(const request_error&)>;

    /// max_body_size 0 disables the size limit
    body_reader(const http_request& request, size_t max_body_size, std::chrono::milliseconds timeout);

    virtual ~body_reader() = default;

    /**
     * Checks Transfer-Encoding and Content-Length before any byte is read and records the
     * declared body length.
     */
    std::optional<request_error> check_headers();

    /**
     * Reads the whole body from the stream. Returns the body on success, or no value once
     * a failure has been reported through the handler.
     */
    awaitable<std::optional<std::string>> read(std::shared_ptr<body_stream> stream, error_handler handler);

    // state machine events, all return false when ignored because the reader already completed
    bool on_data(const uint8_t* data, size_t size);
    bool on_end();
    bool on_error();
    bool on_timeout();

    state get_state() const;
    bool succeeded() const;
    const std::optional<request_error>& get_error() const { return error_; }
    const std::string& get_body() const { return body_; }
    size_t get_received() const { return received_; }
    std::optional<size_t> get_declared_length() const { return declared_length_; }

private:
    bool complete(std::optional<request_error> error, bool destroy_stream = false);

    const http_request& request_;
    const size_t max_body_size_;
    const std::chrono::milliseconds timeout_;

    std::atomic<bool> completed_{false};
    std::optional<request_error> error_;
    std::optional<size_t> declared_length_;
    std::string body_;
    size_t received_ = 0;

    std::shared_ptr<body_stream> stream_;
    error_handler on_error_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_BODY_READER_HPP
