#include "validator.hpp"
#include <deque>
#include <system_error>

namespace fs = std::filesystem;

namespace cedarmcp {

namespace {

// Same bound the kernel applies (MAXSYMLINKS)
constexpr int kMaxSymlinkHops = 40;

void push_components_front(std::deque<fs::path>& pending, const fs::path& p) {
    const fs::path rel = p.relative_path();
    std::vector<fs::path> parts(rel.begin(), rel.end());
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        pending.push_front(*it);
    }
}

fs::path absolute_from_cwd(const fs::path& p, const std::string& raw, PolicyErrorKind kind) {
    if (p.is_absolute()) return p;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        throw PolicyError(kind, raw, "Cannot determine working directory: " + ec.message());
    }
    return cwd / p;
}

fs::path canonical_root(const std::string& candidate) {
    if (candidate.empty()) {
        throw PolicyError(PolicyErrorKind::RootInvalid, candidate,
                          "Root directory not specified");
    }
    if (candidate.find('\0') != std::string::npos) {
        throw PolicyError(PolicyErrorKind::RootInvalid, candidate,
                          "Root path contains null byte");
    }

    fs::path resolved;
    try {
        resolved = resolve_canonical(
            absolute_from_cwd(fs::path(candidate), candidate, PolicyErrorKind::RootInvalid));
    } catch (const PolicyError& e) {
        if (e.kind() == PolicyErrorKind::RootInvalid) throw;
        throw PolicyError(PolicyErrorKind::RootInvalid, candidate, e.what());
    }

    std::error_code ec;
    auto st = fs::status(resolved, ec);
    if (!fs::exists(st)) {
        throw PolicyError(PolicyErrorKind::RootInvalid, candidate,
                          "Root directory does not exist: " + candidate);
    }
    if (!fs::is_directory(st)) {
        throw PolicyError(PolicyErrorKind::RootInvalid, candidate,
                          "Root path is not a directory: " + candidate);
    }
    return resolved;
}

} // namespace

const char* policy_error_kind_name(PolicyErrorKind kind) {
    switch (kind) {
        case PolicyErrorKind::RootInvalid:       return "RootInvalid";
        case PolicyErrorKind::PathEscape:        return "PathEscape";
        case PolicyErrorKind::DenylistViolation: return "DenylistViolation";
        case PolicyErrorKind::ReadOnlyViolation: return "ReadOnlyViolation";
        case PolicyErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
    }
    return "Unknown";
}

// ── PolicyError ─────────────────────────────────────────────────

PolicyError::PolicyError(PolicyErrorKind kind, std::string path, const std::string& message)
    : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

PolicyError PolicyError::denylisted(std::string path, std::string pattern) {
    std::string message = "Path matches denylist pattern '" + pattern + "': " + path;
    PolicyError err(PolicyErrorKind::DenylistViolation, std::move(path), message);
    err.pattern_ = std::move(pattern);
    return err;
}

PolicyError PolicyError::too_large(std::string path, uintmax_t actual, uintmax_t limit) {
    std::string message = "File exceeds maximum size (" + std::to_string(limit) +
                          " bytes): " + path + " is " + std::to_string(actual) + " bytes";
    PolicyError err(PolicyErrorKind::SizeLimitExceeded, std::move(path), message);
    err.actual_size_ = actual;
    err.limit_ = limit;
    return err;
}

// ── Resolution helpers ──────────────────────────────────────────

fs::path resolve_canonical(const fs::path& path) {
    const std::string raw = path.string();
    if (!path.is_absolute()) {
        return resolve_canonical(absolute_from_cwd(path, raw, PolicyErrorKind::PathEscape));
    }

    fs::path current = path.root_path();
    std::deque<fs::path> pending;
    push_components_front(pending, path);

    int hops = 0;

    while (!pending.empty()) {
        fs::path part = std::move(pending.front());
        pending.pop_front();

        if (part.empty() || part == ".") continue;
        if (part == "..") {
            current = current.parent_path();
            continue;
        }

        // Absent components are kept lexically; a later ".." may climb back
        // into existing directories, so every component is inspected.
        fs::path next = current / part;
        std::error_code ec;
        auto st = fs::symlink_status(next, ec);
        if (ec && st.type() != fs::file_type::not_found) {
            throw PolicyError(PolicyErrorKind::PathEscape, raw,
                              "Cannot resolve path '" + raw + "': " + ec.message());
        }
        if (!fs::is_symlink(st)) {
            current = std::move(next);
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            throw PolicyError(PolicyErrorKind::PathEscape, raw,
                              "Too many levels of symbolic links: " + raw);
        }
        fs::path target = fs::read_symlink(next, ec);
        if (ec) {
            throw PolicyError(PolicyErrorKind::PathEscape, raw,
                              "Cannot read symbolic link '" + next.string() + "': " +
                              ec.message());
        }
        if (target.is_absolute()) {
            current = target.root_path();
        }
        push_components_front(pending, target);
    }

    return current;
}

bool is_within(const fs::path& candidate, const fs::path& parent) {
    auto c = candidate.begin();
    for (auto p = parent.begin(); p != parent.end(); ++p, ++c) {
        if (c == candidate.end() || *c != *p) return false;
    }
    return true;
}

// ── PathValidator ───────────────────────────────────────────────

PathValidator::PathValidator(const fs::path& root, bool read_only, uintmax_t max_file_size,
                             std::optional<std::vector<std::string>> denylist) {
    if (max_file_size == 0) {
        throw std::invalid_argument("max_file_size must be positive");
    }
    policy_.root = canonical_root(root.string());
    policy_.read_only = read_only;
    policy_.max_file_size = max_file_size;
    policy_.denylist = Denylist(denylist ? *denylist : default_denylist());
}

fs::path PathValidator::validate_root(const std::string& candidate) const {
    return canonical_root(candidate);
}

fs::path PathValidator::validate_path(const std::string& raw, AccessIntent intent) const {
    if (raw.find('\0') != std::string::npos) {
        throw PolicyError(PolicyErrorKind::PathEscape, raw, "Path contains null byte");
    }

    // 1. Resolve once; everything below works on this value only.
    const fs::path input(raw);
    const fs::path resolved = resolve_canonical(input.is_absolute() ? input
                                                                    : policy_.root / input);

    // 2. Confinement
    if (!is_within(resolved, policy_.root)) {
        throw PolicyError(PolicyErrorKind::PathEscape, raw,
                          "Path escape attempt: '" + raw +
                          "' resolves outside root directory");
    }

    // 3-4. Denylist on the root-relative form
    const std::string relative = resolved.lexically_relative(policy_.root).generic_string();
    if (auto pattern = policy_.denylist.first_match(relative)) {
        throw PolicyError::denylisted(raw, *pattern);
    }

    // 5. Read-only
    if (intent == AccessIntent::Write && policy_.read_only) {
        throw PolicyError(PolicyErrorKind::ReadOnlyViolation, raw,
                          "Write operation rejected: server in read-only mode");
    }

    // 6. Size ceiling, existing regular files only
    if (intent == AccessIntent::Read) {
        std::error_code ec;
        auto st = fs::status(resolved, ec);
        if (!ec && fs::is_regular_file(st)) {
            uintmax_t size = fs::file_size(resolved, ec);
            // ec here means the file vanished after status(); nothing to measure
            if (!ec && size > policy_.max_file_size) {
                throw PolicyError::too_large(raw, size, policy_.max_file_size);
            }
        }
    }

    return resolved;
}

} // namespace cedarmcp
