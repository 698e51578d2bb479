/*
 * AirGap C++ - Path Security Context Implementation
 *
 * Validation order (first match wins):
 *   1. raw ".." segment                      -> traversal_detected
 *   2. expand "~", make absolute
 *   3. canonicalize (resolve symlinks, or lexical only)
 *   4. blocked pattern                       -> blocked_pattern
 *   5. allowed-root boundary                 -> outside_allowed_roots
 *   6. symlink target re-verification        -> symlink_escape
 *   7. allowed
 */
#include <airgap/core/path_security.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <deque>
#include <fnmatch.h>

namespace airgap {

// Same bound as the kernel's MAXSYMLINKS
static const int MAX_SYMLINK_HOPS = 40;

const char* denial_reason_str(PathDenialReason reason) {
    switch (reason) {
        case PathDenialReason::OUTSIDE_ALLOWED_ROOTS: return "outside_allowed_roots";
        case PathDenialReason::TRAVERSAL_DETECTED: return "traversal_detected";
        case PathDenialReason::SYMLINK_ESCAPE: return "symlink_escape";
        case PathDenialReason::BLOCKED_PATTERN: return "blocked_pattern";
        case PathDenialReason::NOT_EXISTS: return "not_exists";
        case PathDenialReason::PERMISSION_DENIED: return "permission_denied";
        case PathDenialReason::NONE:
        default: return "";
    }
}

// ============================================================================
// Construction
// ============================================================================

PathSecurityContext::PathSecurityContext(const AirGapConfig& config, const FileSystem& fs)
    : fs_(fs)
    , blocked_patterns_(config.blocked_patterns)
{
    for (size_t i = 0; i < config.allowed_roots.size(); ++i) {
        const std::string& root = config.allowed_roots[i];

        std::string absolute;
        std::string canonical;
        if (make_absolute(expand_user(root), absolute) != 0 ||
            resolve(absolute, canonical) != 0) {
            LOG_WARN("Dropping allowed root that cannot be resolved: %s", root.c_str());
            continue;
        }

        FileStat st;
        if (fs_.stat(canonical, st) != 0 || st.kind != FileKind::DIRECTORY) {
            LOG_WARN("Dropping allowed root that is not a directory: %s", root.c_str());
            continue;
        }

        allowed_roots_.push_back(canonical);
        LOG_DEBUG("Allowed root: %s", canonical.c_str());
    }

    if (allowed_roots_.empty()) {
        LOG_WARN("No usable allowed roots: all paths will be denied");
    }
}

// ============================================================================
// Helpers
// ============================================================================

int PathSecurityContext::make_absolute(const std::string& path, std::string& out) const {
    if (!path.empty() && path[0] == '/') {
        out = normalize_path(path);
        return 0;
    }

    std::string cwd;
    int err = fs_.current_dir(cwd);
    if (err != 0) return err;

    out = normalize_path(join_path(cwd, path));
    return 0;
}

int PathSecurityContext::resolve(const std::string& absolute_path, std::string& out) const {
    std::deque<std::string> pending;
    std::vector<std::string> parts = split(absolute_path, '/');
    for (size_t i = 0; i < parts.size(); ++i) {
        pending.push_back(parts[i]);
    }

    std::vector<std::string> resolved;
    int hops = 0;
    bool resolving = true;

    while (!pending.empty()) {
        std::string comp = pending.front();
        pending.pop_front();

        if (comp.empty() || comp == ".") continue;
        if (comp == "..") {
            if (!resolved.empty()) resolved.pop_back();
            continue;
        }

        if (!resolving) {
            resolved.push_back(comp);
            continue;
        }

        std::string candidate = "/" + join(resolved, "/");
        candidate = join_path(candidate, comp);

        FileStat st;
        if (fs_.lstat(candidate, st) != 0 || st.kind != FileKind::SYMLINK) {
            // Missing or non-link components are taken as-is
            resolved.push_back(comp);
            continue;
        }

        std::string target;
        if (++hops > MAX_SYMLINK_HOPS || fs_.read_link(candidate, target) != 0) {
            // Link loop or unreadable link: keep the rest lexical
            resolved.push_back(comp);
            resolving = false;
            continue;
        }

        if (!target.empty() && target[0] == '/') {
            resolved.clear();
        }
        std::vector<std::string> target_parts = split(target, '/');
        for (size_t i = target_parts.size(); i > 0; --i) {
            pending.push_front(target_parts[i - 1]);
        }
    }

    out = "/" + join(resolved, "/");
    return 0;
}

std::string PathSecurityContext::match_blocked_pattern(const std::string& path) const {
    std::string basename = base_name(path);

    std::string normalized = path;
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (normalized[i] == '\\') normalized[i] = '/';
    }

    for (size_t i = 0; i < blocked_patterns_.size(); ++i) {
        const std::string& pattern = blocked_patterns_[i];

        if (fnmatch(pattern.c_str(), basename.c_str(), FNM_NOESCAPE) == 0) {
            return pattern;
        }
        // Patterns such as ".git/config" match anywhere in the path
        if (pattern.find('/') != std::string::npos &&
            normalized.find(pattern) != std::string::npos) {
            return pattern;
        }
    }
    return "";
}

bool PathSecurityContext::is_under_allowed_root(const std::string& canonical_path) const {
    for (size_t i = 0; i < allowed_roots_.size(); ++i) {
        const std::string& root = allowed_roots_[i];
        if (canonical_path == root) {
            return true;
        }
        // Separator-bounded prefix: /home/user must not admit /home/username
        std::string prefix = (!root.empty() && root.back() == '/') ? root : root + "/";
        if (starts_with(canonical_path, prefix)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Validation
// ============================================================================

PathValidationResult PathSecurityContext::validate_path(const std::string& path,
                                                        bool follow_symlinks) const {
    if (allowed_roots_.empty()) {
        return PathValidationResult::deny(PathDenialReason::OUTSIDE_ALLOWED_ROOTS,
                                          "no allowed roots configured");
    }

    // 1. Traversal in the raw input
    std::vector<std::string> segments = split(path, '/');
    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i] == "..") {
            return PathValidationResult::deny(PathDenialReason::TRAVERSAL_DETECTED,
                                              "path contains traversal sequence");
        }
    }

    // 2. Expand and make absolute
    std::string absolute;
    int err = make_absolute(expand_user(path), absolute);
    if (err != 0) {
        return PathValidationResult::deny(PathDenialReason::PERMISSION_DENIED, strerror(err));
    }

    // 3. Canonicalize
    std::string canonical;
    if (follow_symlinks) {
        err = resolve(absolute, canonical);
        if (err != 0) {
            return PathValidationResult::deny(PathDenialReason::PERMISSION_DENIED, strerror(err));
        }
    } else {
        canonical = absolute;
    }

    // 4. Blocked patterns run before any existence or boundary check
    std::string blocked = match_blocked_pattern(canonical);
    if (!blocked.empty()) {
        return PathValidationResult::deny(PathDenialReason::BLOCKED_PATTERN,
                                          "matches blocked pattern: " + blocked, canonical);
    }

    // 5. Boundary
    if (!is_under_allowed_root(canonical)) {
        return PathValidationResult::deny(PathDenialReason::OUTSIDE_ALLOWED_ROOTS,
                                          "path is outside allowed roots", canonical);
    }

    // 6. The link may have been swapped since step 3; resolve it again
    if (follow_symlinks) {
        FileStat st;
        if (fs_.lstat(absolute, st) == 0 && st.kind == FileKind::SYMLINK) {
            std::string target;
            if (resolve(absolute, target) != 0 || !is_under_allowed_root(target)) {
                return PathValidationResult::deny(PathDenialReason::SYMLINK_ESCAPE,
                                                  "symlink target escapes allowed roots",
                                                  canonical);
            }
        }
    }

    return PathValidationResult::allow(canonical);
}

PathValidationResult PathSecurityContext::validate_path_no_follow(const std::string& path) const {
    return validate_path(path, false);
}

bool PathSecurityContext::is_path_accessible(const std::string& path) const {
    return validate_path(path).allowed;
}

bool PathSecurityContext::is_entry_in_allowed_scope(const std::string& entry_path) const {
    return validate_path_no_follow(entry_path).allowed;
}

} // namespace airgap
