#include "path_template.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <charconv>
#include <regex>

namespace apisrv::http {

namespace {

    const std::regex param_regex(R"(^\{([A-Za-z_][A-Za-z0-9_]*)\}$)");
    const std::regex splat_regex(R"(^\[([A-Za-z_][A-Za-z0-9_]*)(?::([0-9]+)(?::([0-9]+))?)?\]$)");

    std::size_t parse_bound(const std::string& pattern, const std::string& value) {
        std::size_t result = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            throw template_error("Bad splat bound '" + value + "' in path template: " + pattern);
        }
        return result;
    }

}

path_template::path_template(const std::string& pattern)
    : pattern_(pattern)
{
    if (pattern.empty() || pattern.front() != '/') {
        throw template_error("Bad request handler path: " + pattern);
    }

    // root template has no segments at all
    if (pattern == "/") {
        min_segments_from_.push_back(0);
        return;
    }

    trailing_slash_ = pattern.back() == '/';
    std::string trimmed = trailing_slash_ ? pattern.substr(1, pattern.size() - 2) : pattern.substr(1);

    std::vector<std::string> raw_segments;
    boost::algorithm::split(raw_segments, trimmed, boost::algorithm::is_any_of("/"));

    for (const auto& raw : raw_segments) {
        compile_segment(raw);
    }

    // suffix sums, computed right to left with a zero sentinel past the end
    min_segments_from_.assign(segments_.size() + 1, 0);
    for (std::size_t i = segments_.size(); i-- > 0;) {
        min_segments_from_[i] = min_segments_from_[i + 1] + segments_[i].min_items;
    }
}

void path_template::compile_segment(const std::string& raw) {
    path_segment segment;
    std::smatch match;

    if (std::regex_match(raw, match, param_regex)) {
        segment.type = path_segment::kind::param;
        segment.value = match[1];
    } else if (std::regex_match(raw, match, splat_regex)) {
        segment.type = path_segment::kind::splat;
        segment.value = match[1];
        segment.min_items = path_segment::default_min_items;
        segment.max_items = path_segment::default_max_items;
        if (match[2].matched) {
            segment.min_items = parse_bound(pattern_, match[2]);
            segment.max_items = match[3].matched ? parse_bound(pattern_, match[3]) : segment.min_items;
        }
        if (segment.min_items < 1 || segment.max_items < segment.min_items) {
            throw template_error("Bad splat bounds for '" + segment.value + "' in path template: " + pattern_);
        }
        has_splat_ = true;
    } else if (raw.find_first_of("{}[]") != std::string::npos) {
        throw template_error("Malformed capture '" + raw + "' in path template: " + pattern_);
    } else {
        segment.value = raw;
    }

    if (segment.type != path_segment::kind::literal) {
        exact_ = false;
    }
    segments_.push_back(std::move(segment));
}

} // namespace apisrv::http
