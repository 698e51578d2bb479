/*
 * AirGap C++ - list_dir Implementation
 */
#include <airgap/core/list_dir.hpp>
#include <airgap/core/filesystem.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <memory>

namespace airgap {

Json DirectoryEntry::to_json() const {
    Json j;
    j["name"] = name;
    j["path"] = path;
    j["type"] = type;
    j["accessible"] = accessible;
    if (size >= 0) j["size"] = size;
    if (!denial_reason.empty()) j["denial_reason"] = denial_reason;
    return j;
}

Json ListDirResult::to_json() const {
    Json j;
    j["success"] = success;
    j["path"] = path;
    Json list = Json::array();
    for (size_t i = 0; i < entries.size(); ++i) {
        list.push_back(entries[i].to_json());
    }
    j["entries"] = list;
    j["truncated"] = truncated;
    j["error"] = error.empty() ? Json() : Json(error);
    return j;
}

namespace {

ListDirResult fail(AuditLogger& audit, const std::string& path,
                   const std::string& reason, const std::string& error) {
    audit.log_denied("list_dir", path, reason);

    ListDirResult r;
    r.success = false;
    r.path = path;
    r.error = error;
    return r;
}

void mark_inaccessible(DirectoryEntry& entry, const std::string& type, const char* reason) {
    entry.type = type;
    entry.accessible = false;
    entry.size = -1;
    entry.denial_reason = reason;
}

// Symlink whose own path is in scope: authorize the target, then type it
void describe_symlink(const PathSecurityContext& security, DirectoryEntry& entry) {
    PathValidationResult target = security.validate_path(entry.path);
    if (!target.allowed) {
        mark_inaccessible(entry, "symlink", denial_reason_str(PathDenialReason::SYMLINK_ESCAPE));
        return;
    }

    entry.accessible = true;
    FileStat st;
    if (security.filesystem().stat(entry.path, st) != 0) {
        entry.type = "symlink";
    } else if (st.kind == FileKind::DIRECTORY) {
        entry.type = "directory";
    } else if (st.kind == FileKind::REGULAR) {
        entry.type = "file";
    } else {
        entry.type = "symlink";
    }
}

void describe_entry(const PathSecurityContext& security, const DirEntryInfo& info,
                    DirectoryEntry& entry) {
    const FileSystem& fs = security.filesystem();

    FileKind kind = info.kind;
    FileStat st;
    bool have_stat = false;

    // Regular files need lstat for their size; unknown kinds need it at all
    if (!info.kind_known || info.kind == FileKind::REGULAR) {
        if (fs.lstat(entry.path, st) != 0) {
            mark_inaccessible(entry, "unknown",
                              denial_reason_str(PathDenialReason::PERMISSION_DENIED));
            return;
        }
        kind = st.kind;
        have_stat = true;
    }

    switch (kind) {
        case FileKind::SYMLINK:
            describe_symlink(security, entry);
            return;
        case FileKind::DIRECTORY:
            entry.type = "directory";
            break;
        case FileKind::REGULAR:
            entry.type = "file";
            entry.size = have_stat ? st.size : -1;
            break;
        case FileKind::OTHER:
        default:
            entry.type = "unknown";
            break;
    }
    entry.accessible = true;
}

} // anonymous namespace

ListDirResult list_dir(const AirGapConfig& config,
                       const PathSecurityContext& security,
                       AuditLogger& audit,
                       const std::string& path) {
    PathValidationResult validation = security.validate_path(path);
    if (!validation.allowed) {
        LOG_DEBUG("list_dir denied (%s): %s", denial_reason_str(validation.denial_reason),
                  path.c_str());
        return fail(audit, path, denial_reason_str(validation.denial_reason),
                    "Access denied: " + validation.denial_detail);
    }

    const std::string& canonical = validation.canonical_path;
    const FileSystem& fs = security.filesystem();

    FileStat st;
    int err = fs.stat(canonical, st);
    if (err != 0) {
        const char* reason = (err == ENOENT || err == ENOTDIR)
            ? denial_reason_str(PathDenialReason::NOT_EXISTS) : "os_error";
        return fail(audit, path, reason, std::string("Cannot access directory: ") + strerror(err));
    }
    if (st.kind != FileKind::DIRECTORY) {
        return fail(audit, path, "not_a_directory", "Path is not a directory");
    }

    std::unique_ptr<DirectoryStream> stream;
    err = fs.open_directory(canonical, stream);
    if (err != 0) {
        return fail(audit, path, "os_error", std::string("Error reading directory: ") + strerror(err));
    }

    ListDirResult result;
    result.path = canonical;

    DirEntryInfo info;
    while (stream->next(info)) {
        if (static_cast<int64_t>(result.entries.size()) >= config.max_results) {
            result.truncated = true;
            break;
        }

        DirectoryEntry entry;
        entry.name = info.name;
        entry.path = join_path(canonical, info.name);

        PathValidationResult scope = security.validate_path_no_follow(entry.path);
        if (scope.allowed) {
            describe_entry(security, info, entry);
        } else {
            // Nothing about a denied entry is queried
            mark_inaccessible(entry, "unknown", denial_reason_str(scope.denial_reason));
        }
        result.entries.push_back(entry);
    }

    if (stream->error() != 0) {
        return fail(audit, path, "os_error",
                    std::string("Error reading directory: ") + strerror(stream->error()));
    }

    result.success = true;
    audit.log_list_dir(canonical, static_cast<int64_t>(result.entries.size()));
    return result;
}

} // namespace airgap
