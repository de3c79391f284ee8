#ifndef APISRV_HTTP_PATH_MATCHER_HPP
#define APISRV_HTTP_PATH_MATCHER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "path_template.hpp"

namespace apisrv::http {

/**
 * Request path split into raw (still percent-encoded) segments. One trailing slash is
 * trimmed from paths longer than the root and remembered in trailing_slash.
 */
struct request_path {
    std::vector<std::string> segments;
    bool trailing_slash = false;

    /// returns no value if the path does not start with '/'
    static std::optional<request_path> parse(std::string_view path);
};

class path_matcher {
public:
    /**
     * Matches a compiled template against a request path. On success returns an object
     * with one entry per capture: a decoded string for {name} captures and an array of
     * decoded strings for [name] captures. Variable length captures take the shortest
     * length that lets the rest of the template match.
     */
    static std::optional<nlohmann::json> match(const path_template& path, const request_path& request);
};

} // namespace apisrv::http

#endif // APISRV_HTTP_PATH_MATCHER_HPP
