#include "handler_registry.hpp"
#include "path_matcher.hpp"
#include "../../../util/logger.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace apisrv::http {

method handler_registry::normalize_method(std::string_view method) {
    auto result = get_method(method);
    if (result == method::UNKNOWN) {
        throw std::invalid_argument("Unsupported request handler method: " + std::string(method));
    }
    return result;
}

void handler_registry::add(std::string_view method, const std::string& pattern, handler callback, handler_options options) {
    auto http_method = normalize_method(method);
    if (!callback) {
        throw std::invalid_argument("Bad request handler callback for " + get_method(http_method) + " " + pattern);
    }

    // compile outside the lock; template errors propagate to the caller
    auto entry = std::make_shared<const handler_entry>(pattern, std::move(callback), std::move(options));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& store = stores_[http_method];
    if (entry->path.is_exact()) {
        store.exact[pattern] = std::move(entry);
    } else {
        auto it = std::find_if(store.dynamic.begin(), store.dynamic.end(), [&pattern](const auto& existing) {
            return existing->path.get_pattern() == pattern;
        });
        if (it != store.dynamic.end()) {
            *it = std::move(entry);
        } else {
            store.dynamic.push_back(std::move(entry));
        }
    }

    LOG_DEBUG("registered handler {} {}", get_method(http_method), pattern);
}

bool handler_registry::method_store::remove(const std::string& pattern) {
    bool removed = exact.erase(pattern) > 0;
    auto it = std::remove_if(dynamic.begin(), dynamic.end(), [&pattern](const auto& entry) {
        return entry->path.get_pattern() == pattern;
    });
    if (it != dynamic.end()) {
        dynamic.erase(it, dynamic.end());
        removed = true;
    }
    return removed;
}

bool handler_registry::remove(std::string_view method, const std::string& pattern) {
    if (pattern.empty() || pattern.front() != '/') {
        throw std::invalid_argument("Bad request handler path: " + pattern);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (method == "*") {
        bool removed = false;
        for (auto it = stores_.begin(); it != stores_.end();) {
            removed = it->second.remove(pattern) || removed;
            if (it->second.empty()) {
                it = stores_.erase(it);
            } else {
                ++it;
            }
        }
        LOG_DEBUG("removed handler * {}: {}", pattern, removed);
        return removed;
    }

    auto http_method = normalize_method(method);
    auto store = stores_.find(http_method);
    if (store == stores_.end()) {
        return false;
    }
    bool removed = store->second.remove(pattern);
    if (store->second.empty()) {
        stores_.erase(store);
    }
    LOG_DEBUG("removed handler {} {}: {}", get_method(http_method), pattern, removed);
    return removed;
}

std::optional<route_match> handler_registry::find_in_store(const method_store& store, std::string_view path) {
    const std::string key(path);
    auto exact = store.exact.find(key);
    if (exact != store.exact.end()) {
        return route_match{exact->second, nlohmann::json::object()};
    }

    // "/foo/" also reaches "/foo", unless "/foo" was registered as requiring the slash
    if (key.size() > 1 && key.back() == '/') {
        exact = store.exact.find(key.substr(0, key.size() - 1));
        if (exact != store.exact.end() && !exact->second->path.has_trailing_slash()) {
            return route_match{exact->second, nlohmann::json::object()};
        }
    }

    if (store.dynamic.empty()) {
        return std::nullopt;
    }

    auto request = request_path::parse(path);
    if (!request) {
        return std::nullopt;
    }

    for (const auto& entry : store.dynamic) {
        if (auto params = path_matcher::match(entry->path, *request)) {
            return route_match{entry, std::move(*params)};
        }
    }
    return std::nullopt;
}

std::optional<route_match> handler_registry::lookup(method method, std::string_view path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto store = stores_.find(method);
    if (store == stores_.end()) {
        LOG_DEBUG("No handlers registered for method {}", get_method(method));
        return std::nullopt;
    }

    auto match = find_in_store(store->second, path);
    if (match) {
        LOG_DEBUG("Matched handler: {} {}", get_method(method), match->entry->path.get_pattern());
    } else {
        LOG_DEBUG("No matching handler found for {} {}", get_method(method), path);
    }
    return match;
}

bool handler_registry::has_other_method_match(method method, std::string_view path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto& [key, store] : stores_) {
        if (key == method) {
            continue;
        }
        if (find_in_store(store, path)) {
            return true;
        }
    }
    return false;
}

size_t handler_registry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [key, store] : stores_) {
        count += store.exact.size() + store.dynamic.size();
    }
    return count;
}

bool handler_registry::empty() const {
    return size() == 0;
}

} // namespace apisrv::http
