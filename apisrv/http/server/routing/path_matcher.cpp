#include "path_matcher.hpp"
#include "../../util/url.hpp"

#include <algorithm>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace apisrv::http {

std::optional<request_path> request_path::parse(std::string_view path) {
    if (path.empty() || path.front() != '/') {
        return std::nullopt;
    }

    request_path result;
    if (path == "/") {
        return result;
    }

    result.trailing_slash = path.back() == '/';
    std::string_view trimmed = result.trailing_slash ? path.substr(0, path.size() - 1) : path;
    // "//" trims down to the root and has no segments
    if (trimmed == "/") {
        return result;
    }

    const std::string remainder(trimmed.substr(1));
    boost::algorithm::split(result.segments, remainder, boost::algorithm::is_any_of("/"));
    return result;
}

namespace {

    // lazily decoded request segments, each one decoded at most once per match
    class decoded_segments {
    public:
        explicit decoded_segments(const std::vector<std::string>& raw)
            : raw_(raw), decoded_(raw.size()), state_(raw.size(), state::unknown) {}

        bool decodable(std::size_t index) {
            if (state_[index] == state::unknown) {
                state_[index] = util::url::uri_component_decode(raw_[index], decoded_[index])
                    ? state::valid : state::invalid;
            }
            return state_[index] == state::valid;
        }

        const std::string& operator[](std::size_t index) const { return decoded_[index]; }

    private:
        enum class state : char { unknown, valid, invalid };
        const std::vector<std::string>& raw_;
        std::vector<std::string> decoded_;
        std::vector<state> state_;
    };

    // a variable length capture still able to grow on backtracking
    struct choice_point {
        std::size_t segment;
        std::size_t position;
        std::size_t length;
        std::size_t max_length;
    };

    struct span {
        std::size_t start = 0;
        std::size_t length = 0;
    };

}

std::optional<nlohmann::json> path_matcher::match(const path_template& path, const request_path& request) {
    const auto& segments = path.get_segments();
    const std::size_t template_count = segments.size();
    const std::size_t request_count = request.segments.size();

    if (path.has_trailing_slash() && !request.trailing_slash) {
        return std::nullopt;
    }
    if (request_count < path.min_segments()) {
        return std::nullopt;
    }
    if (!path.has_splat() && request_count != template_count) {
        return std::nullopt;
    }
    if (template_count == 0) {
        return nlohmann::json::object();
    }

    decoded_segments decoded(request.segments);
    std::vector<span> spans(template_count);
    std::vector<choice_point> choices;

    // splat states (segment, position) known to have no completion
    std::vector<bool> dead((template_count + 1) * (request_count + 1), false);
    auto state_index = [request_count](std::size_t segment, std::size_t position) {
        return segment * (request_count + 1) + position;
    };

    std::size_t t = 0;
    std::size_t r = 0;
    bool backtrack = false;

    while (true) {
        if (backtrack) {
            backtrack = false;
            bool resumed = false;
            while (!choices.empty()) {
                auto& choice = choices.back();
                ++choice.length;
                if (choice.length <= choice.max_length && decoded.decodable(choice.position + choice.length - 1)) {
                    spans[choice.segment] = {choice.position, choice.length};
                    t = choice.segment + 1;
                    r = choice.position + choice.length;
                    resumed = true;
                    break;
                }
                dead[state_index(choice.segment, choice.position)] = true;
                choices.pop_back();
            }
            if (!resumed) {
                return std::nullopt;
            }
        }

        if (t == template_count) {
            if (r == request_count) break;
            backtrack = true;
            continue;
        }

        const auto& segment = segments[t];
        switch (segment.type) {
            case path_segment::kind::literal:
                if (r < request_count && request.segments[r] == segment.value) {
                    spans[t] = {r, 1};
                    ++t;
                    ++r;
                } else {
                    backtrack = true;
                }
                break;

            case path_segment::kind::param:
                if (r < request_count && decoded.decodable(r)) {
                    spans[t] = {r, 1};
                    ++t;
                    ++r;
                } else {
                    backtrack = true;
                }
                break;

            case path_segment::kind::splat: {
                const std::size_t available = request_count - r;
                const std::size_t reserved = path.min_segments_from(t + 1);
                if (dead[state_index(t, r)] || available < reserved + segment.min_items) {
                    backtrack = true;
                    break;
                }
                bool valid = true;
                for (std::size_t k = r; k < r + segment.min_items; ++k) {
                    if (!decoded.decodable(k)) {
                        valid = false;
                        break;
                    }
                }
                if (!valid) {
                    dead[state_index(t, r)] = true;
                    backtrack = true;
                    break;
                }
                const std::size_t max_length = std::min(segment.max_items, available - reserved);
                choices.push_back({t, r, segment.min_items, max_length});
                spans[t] = {r, segment.min_items};
                ++t;
                r += segment.min_items;
                break;
            }
        }
    }

    auto params = nlohmann::json::object();
    for (std::size_t i = 0; i < template_count; ++i) {
        const auto& segment = segments[i];
        if (segment.type == path_segment::kind::param) {
            params[segment.value] = decoded[spans[i].start];
        } else if (segment.type == path_segment::kind::splat) {
            auto parts = nlohmann::json::array();
            for (std::size_t k = spans[i].start; k < spans[i].start + spans[i].length; ++k) {
                parts.push_back(decoded[k]);
            }
            params[segment.value] = std::move(parts);
        }
    }
    return params;
}

} // namespace apisrv::http
