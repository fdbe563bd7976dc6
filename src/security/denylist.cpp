#include "denylist.hpp"

namespace cedarmcp {

const std::vector<std::string>& default_denylist() {
    static const std::vector<std::string> patterns = {
        ".git/**",
        "node_modules/**",
        "__pycache__/**",
        ".env",
        "*.env",
        ".env.*",
        "credentials.json",
        "*.key",
        "*.pem",
        // Same files anywhere below the root
        "**/.git/**",
        "**/node_modules/**",
        "**/__pycache__/**",
        "**/*.env",
        "**/.env.*",
        "**/credentials.json",
        "**/*.key",
        "**/*.pem",
    };
    return patterns;
}

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        std::string_view seg = path.substr(start, end - start);
        if (!seg.empty() && seg != ".") out.push_back(seg);
        start = end + 1;
    }
    return out;
}

bool segment_glob_match(std::string_view glob, std::string_view text) {
    size_t g = 0;
    size_t t = 0;
    size_t star_g = std::string_view::npos;
    size_t star_t = 0;

    while (t < text.size()) {
        if (g < glob.size() && (glob[g] == '?' || glob[g] == text[t])) {
            ++g;
            ++t;
        } else if (g < glob.size() && glob[g] == '*') {
            star_g = g++;
            star_t = t;
        } else if (star_g != std::string_view::npos) {
            // Let the last '*' swallow one more character and retry
            g = star_g + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }
    while (g < glob.size() && glob[g] == '*') ++g;
    return g == glob.size();
}

// ── GlobPattern ─────────────────────────────────────────────────

GlobPattern::GlobPattern(std::string pattern) : text_(std::move(pattern)) {
    for (auto seg : split_segments(text_)) {
        if (seg == "**") {
            // Adjacent "**" segments are equivalent to one
            if (!segments_.empty() && segments_.back().any_depth) continue;
            segments_.push_back(Segment{true, {}});
        } else {
            segments_.push_back(Segment{false, std::string(seg)});
        }
    }
}

bool GlobPattern::match_from(size_t pi, const std::vector<std::string_view>& segments,
                             size_t si) const {
    if (pi == segments_.size()) return si == segments.size();

    const auto& seg = segments_[pi];
    if (seg.any_depth) {
        for (size_t k = si; k <= segments.size(); ++k) {
            if (match_from(pi + 1, segments, k)) return true;
        }
        return false;
    }

    if (si >= segments.size()) return false;
    if (!segment_glob_match(seg.glob, segments[si])) return false;
    return match_from(pi + 1, segments, si + 1);
}

bool GlobPattern::matches(const std::vector<std::string_view>& segments) const {
    return match_from(0, segments, 0);
}

bool GlobPattern::matches(std::string_view relative_path) const {
    return matches(split_segments(relative_path));
}

// ── Denylist ────────────────────────────────────────────────────

Denylist::Denylist(const std::vector<std::string>& patterns) {
    patterns_.reserve(patterns.size());
    for (const auto& p : patterns) {
        patterns_.emplace_back(p);
    }
}

std::optional<std::string> Denylist::first_match(std::string_view relative_path) const {
    if (patterns_.empty()) return std::nullopt;
    auto segments = split_segments(relative_path);
    for (const auto& pattern : patterns_) {
        if (pattern.matches(segments)) return pattern.text();
    }
    return std::nullopt;
}

std::vector<std::string> Denylist::patterns() const {
    std::vector<std::string> out;
    out.reserve(patterns_.size());
    for (const auto& p : patterns_) {
        out.push_back(p.text());
    }
    return out;
}

} // namespace cedarmcp
