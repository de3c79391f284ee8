#ifndef APISRV_HTTP_PATH_TEMPLATE_HPP
#define APISRV_HTTP_PATH_TEMPLATE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace apisrv::http {

// Path template syntax, one capture per segment:
// 1. Literal segments:            "/api/v1/status"
// 2. Single segment capture:      "/users/{user}/devices/{device}"
// 3. Variable length capture:     "/files/[parts]"       1 to 32 segments
//                                 "/files/[parts:3]"     exactly 3 segments
//                                 "/files/[parts:2:5]"   2 to 5 segments
// A trailing slash in the template is significant: "/dir/" only matches "/dir/",
// while "/dir" matches both "/dir" and "/dir/".

class template_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct path_segment {
    enum class kind { literal, param, splat };

    static constexpr std::size_t default_min_items = 1;
    static constexpr std::size_t default_max_items = 32;

    kind type = kind::literal;
    // literal value, or capture name for param and splat segments
    std::string value;
    std::size_t min_items = 1;
    std::size_t max_items = 1;
};

class path_template {
public:
    /// compiles the template, throws template_error if it is malformed
    explicit path_template(const std::string& pattern);

    const std::string& get_pattern() const { return pattern_; }
    const std::vector<path_segment>& get_segments() const { return segments_; }

    bool is_exact() const { return exact_; }
    bool has_splat() const { return has_splat_; }
    bool has_trailing_slash() const { return trailing_slash_; }

    /// minimum number of request segments required by segments [index, end)
    std::size_t min_segments_from(std::size_t index) const { return min_segments_from_[index]; }
    std::size_t min_segments() const { return min_segments_from_.front(); }

private:
    std::string pattern_;
    std::vector<path_segment> segments_;
    std::vector<std::size_t> min_segments_from_;
    bool exact_ = true;
    bool has_splat_ = false;
    bool trailing_slash_ = false;

    void compile_segment(const std::string& raw);
};

} // namespace apisrv::http

#endif // APISRV_HTTP_PATH_TEMPLATE_HPP
