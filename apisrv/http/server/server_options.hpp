#ifndef APISRV_HTTP_SERVER_OPTIONS_HPP
#define APISRV_HTTP_SERVER_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace apisrv::http {

    struct server_options {
        static constexpr std::chrono::milliseconds DEFAULT_BODY_READ_TIMEOUT{2000};
        static constexpr size_t DEFAULT_MAX_BODY_SIZE = 1024 * 1024;

        // time allowed to receive the whole request body
        std::chrono::milliseconds body_read_timeout = DEFAULT_BODY_READ_TIMEOUT;

        // 0 disables the limit
        size_t max_body_size = DEFAULT_MAX_BODY_SIZE;

        bool pretty_print_json = false;

        /**
         * Reads bodyReadTimeoutMs, maxBodySize and prettyPrintJsonResponses. Absent or null
         * keys keep their defaults; values of the wrong type or out of range throw
         * std::invalid_argument.
         */
        static server_options from_json(const nlohmann::json& config);

        /// throws std::invalid_argument if a value is out of range
        void validate() const;
    };

}

#endif
