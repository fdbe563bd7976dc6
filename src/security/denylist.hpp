#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cedarmcp {

// A glob over '/'-separated path segments.
//   *   any run of characters within one segment
//   ?   exactly one character within one segment
//   **  (a whole segment) zero or more segments
// Matching is anchored to the whole relative path and case-sensitive.
class GlobPattern {
public:
    explicit GlobPattern(std::string pattern);

    bool matches(const std::vector<std::string_view>& segments) const;
    bool matches(std::string_view relative_path) const;

    const std::string& text() const { return text_; }

private:
    struct Segment {
        bool any_depth;      // "**"
        std::string glob;    // unused when any_depth
    };

    bool match_from(size_t pi, const std::vector<std::string_view>& segments,
                    size_t si) const;

    std::string text_;
    std::vector<Segment> segments_;
};

// Ordered list of compiled patterns. First match wins.
class Denylist {
public:
    Denylist() = default;
    explicit Denylist(const std::vector<std::string>& patterns);

    // Returns the first pattern matching relative_path, if any.
    std::optional<std::string> first_match(std::string_view relative_path) const;

    bool matches_any(std::string_view relative_path) const {
        return first_match(relative_path).has_value();
    }

    std::vector<std::string> patterns() const;
    bool empty() const { return patterns_.empty(); }
    size_t size() const { return patterns_.size(); }

private:
    std::vector<GlobPattern> patterns_;
};

// Built-in patterns used when the configuration supplies none.
const std::vector<std::string>& default_denylist();

// Split a relative path on '/', dropping empty and "." segments.
std::vector<std::string_view> split_segments(std::string_view path);

// Single-segment wildcard match ('*' and '?'). Never crosses a '/'.
bool segment_glob_match(std::string_view glob, std::string_view text);

} // namespace cedarmcp
