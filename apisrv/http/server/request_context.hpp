#ifndef APISRV_HTTP_REQUEST_CONTEXT_HPP
#define APISRV_HTTP_REQUEST_CONTEXT_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/http_request.hpp"

namespace apisrv::http {

    enum class param_source {
        body,
        query,
        path
    };

    /// label used in diagnostics: "request body", "query string" or "path template"
    const std::string& get_param_source_label(param_source source);

    /**
     * Parameter supplied by more than one source. Sources are listed in merge order, so the
     * last one is the source of the value that ended up in params.
     */
    struct param_collision {
        std::string key;
        std::vector<param_source> sources;
    };

    /**
     * State of one request while it moves through the pipeline. It is created when the
     * request arrives and only mutated by the pipeline stages, one at a time. Parameter
     * objects stay null until their stage runs.
     */
    class request_context {
    public:
        explicit request_context(std::shared_ptr<http_request> request);

        virtual ~request_context() = default;

        const std::shared_ptr<http_request>& get_http_request() const { return request_; }

        method get_method() const;
        const std::string& get_method_name() const;

        /// raw request target, including the query string
        const std::string& get_uri() const;

        /// request target without the query string
        std::string_view get_path() const;

        std::string_view get_query() const;

        const std::string& header(std::string_view key) const;

        // parameter objects, null until set
        nlohmann::json body_params;
        nlohmann::json url_params;
        nlohmann::json path_params;
        nlohmann::json params;

        /// get a merged parameter as string, empty if missing or not a string
        std::string operator[](const std::string& key) const;

        bool has(const std::string& key) const;

        /**
         * Copies every key of the source object into params, overwriting existing keys.
         * Each overwrite of a key supplied by another source is logged and recorded.
         */
        void assign_params(const nlohmann::json& source, param_source type);

        const std::map<std::string, param_source>& get_param_sources() const { return param_sources_; }

        const std::vector<param_collision>& get_collisions() const { return collisions_; }

        std::string debug_parameters() const;

    private:
        std::shared_ptr<http_request> request_;
        std::map<std::string, param_source> param_sources_;
        std::vector<param_collision> collisions_;
    };

}

#endif
