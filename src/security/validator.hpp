#pragma once
#include "denylist.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cedarmcp {

enum class AccessIntent { Read, Write };

enum class PolicyErrorKind {
    RootInvalid,
    PathEscape,
    DenylistViolation,
    ReadOnlyViolation,
    SizeLimitExceeded,
};

const char* policy_error_kind_name(PolicyErrorKind kind);

// Raised for every rejected root or path. Never leaves the validator in a
// different state than before the call.
class PolicyError : public std::runtime_error {
public:
    PolicyError(PolicyErrorKind kind, std::string path, const std::string& message);

    static PolicyError denylisted(std::string path, std::string pattern);
    static PolicyError too_large(std::string path, uintmax_t actual, uintmax_t limit);

    PolicyErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }
    // Set for DenylistViolation
    const std::optional<std::string>& pattern() const { return pattern_; }
    // Set for SizeLimitExceeded
    std::optional<uintmax_t> actual_size() const { return actual_size_; }
    std::optional<uintmax_t> limit() const { return limit_; }

private:
    PolicyErrorKind kind_;
    std::string path_;
    std::optional<std::string> pattern_;
    std::optional<uintmax_t> actual_size_;
    std::optional<uintmax_t> limit_;
};

constexpr uintmax_t kDefaultMaxFileSize = 10 * 1024 * 1024;

// Immutable validation parameters for one session.
struct Policy {
    std::filesystem::path root;   // canonical
    bool read_only = false;
    uintmax_t max_file_size = kDefaultMaxFileSize;
    Denylist denylist;
};

// Gatekeeper for every path the tools hand to the edit engine.
//
// The root is canonicalised once at construction. Each validate_path call
// resolves the candidate once (symlinks included), then checks, in order:
// confinement, denylist, read-only, size. Only the returned canonical path
// may be used for the subsequent file operation.
//
// Holds no mutable state; concurrent calls need no locking.
class PathValidator {
public:
    // denylist == nullopt selects default_denylist(). Any supplied list,
    // including an empty one, replaces the defaults.
    // Throws PolicyError(RootInvalid) if root is missing or not a directory,
    // std::invalid_argument if max_file_size is zero.
    explicit PathValidator(const std::filesystem::path& root,
                           bool read_only = false,
                           uintmax_t max_file_size = kDefaultMaxFileSize,
                           std::optional<std::vector<std::string>> denylist = std::nullopt);

    std::filesystem::path validate_path(const std::string& raw, AccessIntent intent) const;

    // Checks a caller-proposed root without changing this validator's own.
    std::filesystem::path validate_root(const std::string& candidate) const;

    const std::filesystem::path& root() const { return policy_.root; }
    bool read_only() const { return policy_.read_only; }
    uintmax_t max_file_size() const { return policy_.max_file_size; }
    const Denylist& denylist() const { return policy_.denylist; }
    const Policy& policy() const { return policy_; }

private:
    Policy policy_;
};

// Absolute path with every symlink followed (dangling ones too) and all
// "." / ".." removed. Components that do not exist yet are kept lexically.
// Throws PolicyError(PathEscape) when resolution cannot complete
// (symlink loop, unreadable component).
std::filesystem::path resolve_canonical(const std::filesystem::path& path);

// Component-wise test that candidate equals parent or lies below it.
// Both arguments must already be canonical.
bool is_within(const std::filesystem::path& candidate, const std::filesystem::path& parent);

} // namespace cedarmcp
