#include "content_type.hpp"

#include <regex>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace apisrv::http {

namespace {

    // split on ';' outside of quoted strings, trimming and dropping empty parts
    std::vector<std::string> split_parts(std::string_view header) {
        std::vector<std::string> parts;
        std::string current;
        bool quoted = false;
        bool escaped = false;

        auto flush = [&]() {
            boost::algorithm::trim(current);
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        };

        for (char c : header) {
            if (escaped) {
                escaped = false;
            } else if (quoted && c == '\\') {
                escaped = true;
            } else if (c == '"') {
                quoted = !quoted;
            } else if (c == ';' && !quoted) {
                flush();
                continue;
            }
            current += c;
        }
        flush();
        return parts;
    }

    std::string unquote(const std::string& value) {
        std::string result;
        result.reserve(value.size());
        for (size_t i = 1; i + 1 < value.size(); ++i) {
            if (value[i] == '\\' && i + 2 < value.size()) {
                ++i;
            }
            result += value[i];
        }
        return result;
    }

}

std::optional<content_type> content_type::parse(std::string_view header) {
    static const std::regex parameter_regex(
        R"(^([!#$%&'*+.^_`|~0-9A-Za-z-]+)=("(?:[^"\\]|\\.)*"|[^\s;"]+)$)");

    auto parts = split_parts(header);
    if (parts.empty()) {
        return std::nullopt;
    }

    content_type result;
    result.media_type_ = boost::algorithm::to_lower_copy(parts.front());

    for (size_t i = 1; i < parts.size(); ++i) {
        std::smatch match;
        if (!std::regex_match(parts[i], match, parameter_regex)) {
            return std::nullopt;
        }
        std::string value = match[2];
        if (!value.empty() && value.front() == '"') {
            value = unquote(value);
        }
        result.parameters_[boost::algorithm::to_lower_copy(match[1].str())] =
            boost::algorithm::to_lower_copy(value);
    }

    return result;
}

bool content_type::has_parameter(const std::string& name) const {
    return parameters_.contains(name);
}

const std::string& content_type::get_parameter(const std::string& name) const {
    auto it = parameters_.find(name);
    if (it != parameters_.end()) {
        return it->second;
    }
    static const std::string empty;
    return empty;
}

}
