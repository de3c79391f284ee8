#include "body_reader.hpp"
#include "../../util/logger.hpp"

#include <charconv>
#include <boost/algorithm/string/trim.hpp>

namespace apisrv::http {

body_reader::body_reader(const http_request& request, size_t max_body_size, std::chrono::milliseconds timeout)
    : request_(request)
    , max_body_size_(max_body_size)
    , timeout_(timeout) {
}

std::optional<request_error> body_reader::check_headers() {
    const bool has_length = request_.has_header(header::content_length);

    if (request_.has_header(header::transfer_encoding) && has_length) {
        return request_error{http_response::status::bad_request, "Both Transfer-Encoding and Content-Length defined."};
    }

    if (!has_length) {
        return std::nullopt;
    }

    // repeated Content-Length headers must agree
    std::optional<size_t> length;
    for (const auto& raw : request_.get_headers_with_key(header::content_length)) {
        const std::string value = boost::algorithm::trim_copy(raw);
        size_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() || (length && *length != parsed)) {
            return request_error{http_response::status::bad_request, "Bad Content-Length header."};
        }
        length = parsed;
    }

    declared_length_ = length;
    if (max_body_size_ && *declared_length_ > max_body_size_) {
        return request_error{http_response::status::payload_too_large, "Request body too large."};
    }
    return std::nullopt;
}

awaitable<std::optional<std::string>> body_reader::read(std::shared_ptr<body_stream> stream, error_handler handler) {
    stream_ = std::move(stream);
    on_error_ = std::move(handler);

    if (auto error = check_headers()) {
        // oversized declared bodies are refused without reading a single byte
        const bool too_large = error->status == http_response::status::payload_too_large;
        complete(std::move(error), too_large);
        co_return std::nullopt;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    timer_ = std::make_unique<boost::asio::steady_timer>(executor);
    timer_->expires_after(timeout_);
    timer_->async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) return; // Timer was cancelled
        self->on_timeout();
    });

    uint8_t buffer[MAX_BUFFER_SIZE];
    while (!completed_) {
        size_t bytes = 0;
        try {
            bytes = co_await stream_->read_some(buffer, MAX_BUFFER_SIZE);
        } catch (const boost::system::system_error& e) {
            if (!completed_) {
                LOG_DEBUG("error while reading request body: {}", e.what());
            }
            on_error();
            break;
        }
        if (bytes == 0) {
            on_end();
            break;
        }
        on_data(buffer, bytes);
    }

    if (!succeeded()) {
        co_return std::nullopt;
    }
    co_return std::move(body_);
}

bool body_reader::on_data(const uint8_t* data, size_t size) {
    if (completed_) {
        return false;
    }

    received_ += size;
    if (declared_length_ && received_ > *declared_length_) {
        return complete(request_error{http_response::status::bad_request, "Request body longer than Content-Length."}, true);
    }
    if (max_body_size_ && received_ > max_body_size_) {
        return complete(request_error{http_response::status::payload_too_large, "Request body too large."}, true);
    }

    body_.append(reinterpret_cast<const char*>(data), size);
    return true;
}

bool body_reader::on_end() {
    if (declared_length_ && body_.size() != *declared_length_) {
        return complete(request_error{http_response::status::bad_request, "Request body length does not match Content-Length."});
    }
    return complete(std::nullopt);
}

bool body_reader::on_error() {
    return complete(request_error{http_response::status::bad_request, "Error occurred while reading the request data."});
}

bool body_reader::on_timeout() {
    if (!complete(request_error{http_response::status::timed_out, "Timeout occurred while reading the request data."})) {
        return false;
    }
    // abort the read still waiting for data
    if (stream_) {
        stream_->cancel();
    }
    return true;
}

bool body_reader::complete(std::optional<request_error> error, bool destroy_stream) {
    bool expected = false;
    if (!completed_.compare_exchange_strong(expected, true)) {
        return false;
    }

    if (timer_) {
        timer_->cancel();
    }

    if (!error) {
        LOG_TRACE("request body completed: {} bytes", body_.size());
        return true;
    }

    LOG_DEBUG("request body rejected ({}): {}", static_cast<int>(error->status), error->detail);
    error_ = std::move(error);
    body_.clear();

    if (on_error_) {
        on_error_(*error_);
    }
    if (destroy_stream && stream_) {
        stream_->destroy();
    }
    return true;
}

body_reader::state body_reader::get_state() const {
    return completed_ ? state::completed : state::reading;
}

bool body_reader::succeeded() const {
    return completed_ && !error_;
}

} // namespace apisrv::http
