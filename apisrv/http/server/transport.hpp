#ifndef APISRV_HTTP_TRANSPORT_HPP
#define APISRV_HTTP_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include "../common/http_response.hpp"
#include "../../util/types.hpp"

namespace apisrv::http {

/**
 * Raw connection owned by the transport. Upgrade handlers receive it as is, and the
 * server destroys it when a request can not be read any further.
 */
class connection {
public:
    virtual ~connection() = default;

    /// tear down the connection, no further bytes are read from it
    virtual void destroy() = 0;
};

/**
 * Request body bytes following already parsed request headers.
 */
class body_stream : public connection {
public:
    ~body_stream() override = default;

    /**
     * Read up to max_size bytes. Returns 0 at the end of the body and throws
     * boost::system::system_error if the transport fails or the read is cancelled.
     */
    virtual awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) = 0;

    /// abort a pending read_some
    virtual void cancel() = 0;
};

/**
 * Destination for the single response produced for a request.
 */
class response_sink {
public:
    virtual ~response_sink() = default;

    virtual void write(std::shared_ptr<http_response> response) = 0;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_TRANSPORT_HPP
