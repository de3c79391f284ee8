#ifndef APISRV_HTTP_UTIL_URL_HPP
#define APISRV_HTTP_UTIL_URL_HPP

#include <map>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace apisrv::http::util::url {

    /**
     * Decodes a single path segment: %XX escapes are decoded and '+' is kept as is.
     * Returns false if an escape is malformed or the decoded bytes are not valid UTF-8.
     */
    bool uri_component_decode(std::string_view in, std::string& out);

    /**
     * Decodes a query string or form component: '+' is a space, valid %XX escapes are
     * decoded and malformed escapes are copied verbatim. Decoded bytes that are not valid
     * UTF-8 are replaced with U+FFFD.
     */
    std::string form_decode(std::string_view in);

    /// parse key=value pairs separated by '&'; pairs without a key are skipped
    void parse_url_encoded_data(std::string_view data, std::multimap<std::string, std::string>& store);

    /// same as above, but repeated keys are collected into arrays in order of appearance
    nlohmann::json parse_url_encoded_object(std::string_view data);

    bool is_valid_utf8(std::string_view data);

    /// replaces every ill-formed UTF-8 subsequence with U+FFFD
    std::string to_valid_utf8(std::string_view data);

}

#endif
