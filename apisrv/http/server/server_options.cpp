#include "server_options.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace apisrv::http {

    namespace {
        const nlohmann::json* get_option(const nlohmann::json& config, const char* key) {
            auto it = config.find(key);
            if (it == config.end() || it->is_null()) return nullptr;
            return &*it;
        }

        uint64_t get_unsigned(const nlohmann::json& value, const char* key) {
            if (value.is_number_unsigned()) return value.get<uint64_t>();
            if (value.is_number_integer() && value.get<int64_t>() >= 0) return value.get<uint64_t>();
            throw std::invalid_argument(std::string("option ") + key + " must be a non-negative integer");
        }
    }

    server_options server_options::from_json(const nlohmann::json& config) {
        if (!config.is_null() && !config.is_object()) {
            throw std::invalid_argument("server options must be a JSON object");
        }

        server_options options;
        if (config.is_null()) return options;

        if (auto value = get_option(config, "bodyReadTimeoutMs")) {
            options.body_read_timeout = std::chrono::milliseconds(get_unsigned(*value, "bodyReadTimeoutMs"));
        }

        if (auto value = get_option(config, "maxBodySize")) {
            options.max_body_size = static_cast<size_t>(get_unsigned(*value, "maxBodySize"));
        }

        if (auto value = get_option(config, "prettyPrintJsonResponses")) {
            if (!value->is_boolean()) {
                throw std::invalid_argument("option prettyPrintJsonResponses must be a boolean");
            }
            options.pretty_print_json = value->get<bool>();
        }

        options.validate();
        return options;
    }

    void server_options::validate() const {
        if (body_read_timeout.count() <= 0) {
            throw std::invalid_argument("body read timeout must be greater than zero");
        }
    }

}
