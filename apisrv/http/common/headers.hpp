#ifndef APISRV_HTTP_HEADERS_HPP
#define APISRV_HTTP_HEADERS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace apisrv::http {

    namespace header {
        constexpr std::string_view content_type = "Content-Type";
        constexpr std::string_view content_length = "Content-Length";
        constexpr std::string_view transfer_encoding = "Transfer-Encoding";
        constexpr std::string_view cache_control = "Cache-Control";
        constexpr std::string_view expires = "Expires";
        constexpr std::string_view pragma = "Pragma";
        constexpr std::string_view authorization = "Authorization";
    }

    /**
     * Ordered list of HTTP headers. Header names are compared case-insensitively and
     * repeated headers are preserved in the order they were added.
     */
    class headers {
    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        virtual ~headers() = default;

        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        bool has_header(std::string_view key) const;
        const std::string& get_header(std::string_view key) const;
        std::vector<std::string> get_headers_with_key(std::string_view key) const;
        bool remove_header(std::string_view key);

        const std::vector<http_header>& get_headers() const;

        const std::string& get_content_type() const;
        const std::string& get_authorization() const;

        bool empty_headers() const;

        void log(const char* scope) const;

        static bool is_header(std::string_view key, std::string_view header) {
            return boost::iequals(key, header);
        }

    protected:
        std::vector<http_header> headers_;
    };

}

#endif
