/*
 * AirGap C++ - Path Security Context
 *
 * Canonicalizes and authorizes paths against the configured allowed roots
 * and blocked patterns. This is the single source of truth for every
 * access decision made by read_file, list_dir and search_text.
 *
 * Denial is always reported as a value (PathValidationResult), never as an
 * exception. The context is immutable after construction and may be shared
 * by concurrent readers.
 */
#ifndef airgap_CORE_PATH_SECURITY_HPP
#define airgap_CORE_PATH_SECURITY_HPP

#include "airgap_config.hpp"
#include "filesystem.hpp"
#include <string>
#include <vector>

namespace airgap {

// Closed set of denial reasons. NONE marks an allowed result and never
// appears on the wire.
enum class PathDenialReason {
    NONE,
    OUTSIDE_ALLOWED_ROOTS,
    TRAVERSAL_DETECTED,
    SYMLINK_ESCAPE,
    BLOCKED_PATTERN,
    NOT_EXISTS,
    PERMISSION_DENIED
};

// "outside_allowed_roots", "traversal_detected", ... ("" for NONE)
const char* denial_reason_str(PathDenialReason reason);

struct PathValidationResult {
    bool allowed;
    // Set whenever it could be computed, including some denials (for audit).
    // Only meaningful to callers when allowed is true.
    std::string canonical_path;
    PathDenialReason denial_reason;
    std::string denial_detail;

    PathValidationResult() : allowed(false), denial_reason(PathDenialReason::NONE) {}

    static PathValidationResult allow(const std::string& canonical) {
        PathValidationResult r;
        r.allowed = true;
        r.canonical_path = canonical;
        return r;
    }

    static PathValidationResult deny(PathDenialReason reason, const std::string& detail,
                                     const std::string& canonical = "") {
        PathValidationResult r;
        r.allowed = false;
        r.denial_reason = reason;
        r.denial_detail = detail;
        r.canonical_path = canonical;
        return r;
    }
};

class PathSecurityContext {
public:
    // Roots that cannot be resolved or are not directories are dropped; an
    // empty root set denies everything. `fs` must outlive the context.
    explicit PathSecurityContext(const AirGapConfig& config,
                                 const FileSystem& fs = default_filesystem());

    // Full pipeline. With follow_symlinks the path is resolved through the
    // filesystem; without it, normalization is purely lexical and no
    // filesystem call is made.
    PathValidationResult validate_path(const std::string& path, bool follow_symlinks = true) const;

    // The only primitive allowed for testing a directory entry: never
    // dereferences a symlink.
    PathValidationResult validate_path_no_follow(const std::string& path) const;

    bool is_path_accessible(const std::string& path) const;
    bool is_entry_in_allowed_scope(const std::string& entry_path) const;

    // Returns the first blocked pattern matching `path`, or "" if none.
    // Patterns are globbed against the basename; patterns containing '/'
    // also match as a substring of the path with '\' normalized to '/'.
    std::string match_blocked_pattern(const std::string& path) const;

    bool is_under_allowed_root(const std::string& canonical_path) const;

    const std::vector<std::string>& allowed_roots() const { return allowed_roots_; }
    const FileSystem& filesystem() const { return fs_; }

private:
    // Non-strict realpath: symlinks are resolved for the components that
    // exist; a missing tail is appended lexically. Returns an errno value
    // only when the path cannot be made absolute.
    int resolve(const std::string& absolute_path, std::string& out) const;

    int make_absolute(const std::string& path, std::string& out) const;

    const FileSystem& fs_;
    std::vector<std::string> allowed_roots_;
    std::vector<std::string> blocked_patterns_;
};

} // namespace airgap

#endif // airgap_CORE_PATH_SECURITY_HPP
