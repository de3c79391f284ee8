#ifndef APISRV_HTTP_REQUEST_ERROR_HPP
#define APISRV_HTTP_REQUEST_ERROR_HPP

#include <string>
#include "../common/http_response.hpp"

namespace apisrv::http {

    /// failure of a pipeline stage, rendered as a single framework error response
    struct request_error {
        http_response::status status;
        std::string detail;
    };

}

#endif
