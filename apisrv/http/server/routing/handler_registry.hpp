#ifndef APISRV_HTTP_HANDLER_REGISTRY_HPP
#define APISRV_HTTP_HANDLER_REGISTRY_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "handler_entry.hpp"
#include "../../common/http_request.hpp"

namespace apisrv::http {

struct route_match {
    std::shared_ptr<const handler_entry> entry;
    nlohmann::json path_params;
};

/**
 * Per-method store of compiled path templates. Capture free templates live in an exact
 * map looked up by literal path; templates with captures are tried with the path matcher in
 * registration order, so the first registered dynamic template that matches wins.
 *
 * Registration and removal may run while lookups are in flight: entries are immutable and
 * shared, and every map update happens under an exclusive lock.
 */
class handler_registry {
public:
    handler_registry() = default;
    virtual ~handler_registry() = default;

    /**
     * Registers a handler for GET, POST, PUT or DELETE (case-insensitive). Registering the
     * same method and template again replaces the previous entry. Throws template_error for
     * bad templates and std::invalid_argument for unsupported methods.
     */
    void add(std::string_view method, const std::string& pattern, handler callback, handler_options options = {});

    /**
     * Removes the handler registered with the literal template string. Method "*" removes
     * it from every method. Returns whether anything was removed.
     */
    bool remove(std::string_view method, const std::string& pattern);

    /// resolve a request path (without query string) for the given method
    std::optional<route_match> lookup(method method, std::string_view path) const;

    /// whether any other method has a handler for this path, used to answer 405 instead of 404
    bool has_other_method_match(method method, std::string_view path) const;

    /// number of registered entries across all methods
    size_t size() const;

    bool empty() const;

private:
    struct method_store {
        std::unordered_map<std::string, std::shared_ptr<const handler_entry>> exact;
        std::vector<std::shared_ptr<const handler_entry>> dynamic;

        bool remove(const std::string& pattern);
        bool empty() const { return exact.empty() && dynamic.empty(); }
    };

    static std::optional<route_match> find_in_store(const method_store& store, std::string_view path);

    static method normalize_method(std::string_view method);

    std::map<method, method_store> stores_;
    mutable std::shared_mutex mutex_;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_HANDLER_REGISTRY_HPP
