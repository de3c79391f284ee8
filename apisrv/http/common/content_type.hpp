#ifndef APISRV_HTTP_CONTENT_TYPE_HPP
#define APISRV_HTTP_CONTENT_TYPE_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace apisrv::http {

    /**
     * Parsed Content-Type header: lowercase media type plus its parameters, with names
     * and values lowercased and quoted-string values unquoted.
     */
    class content_type {
    public:
        /// returns no value if the header is empty or any parameter is malformed
        static std::optional<content_type> parse(std::string_view header);

        const std::string& get_media_type() const { return media_type_; }

        const std::map<std::string, std::string>& get_parameters() const { return parameters_; }

        bool has_parameter(const std::string& name) const;

        /// parameter value or empty string
        const std::string& get_parameter(const std::string& name) const;

    private:
        std::string media_type_;
        std::map<std::string, std::string> parameters_;
    };

}

#endif
