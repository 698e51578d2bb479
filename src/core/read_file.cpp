/*
 * AirGap C++ - read_file Implementation
 */
#include <airgap/core/read_file.hpp>
#include <airgap/core/filesystem.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>
#include <unistd.h>

namespace airgap {

Json ReadFileResult::to_json() const {
    Json j;
    j["success"] = success;
    j["path"] = path;
    j["content"] = has_content ? Json(content) : Json();
    j["bytes_read"] = bytes_read;
    j["offset"] = offset;
    j["limit"] = limit;
    j["truncated"] = truncated;
    j["error"] = error.empty() ? Json() : Json(error);
    return j;
}

namespace {

// Audit reason for a failed open of an authorized path
const char* open_failure_reason(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return denial_reason_str(PathDenialReason::NOT_EXISTS);
        case EACCES:
        case EPERM:
            return denial_reason_str(PathDenialReason::PERMISSION_DENIED);
        case ELOOP:
            // Final component became a symlink after validation
            return denial_reason_str(PathDenialReason::SYMLINK_ESCAPE);
        default:
            return "os_error";
    }
}

ReadFileResult fail(AuditLogger& audit, const std::string& audit_path,
                    const std::string& result_path, int64_t offset, int64_t limit,
                    const std::string& reason, const std::string& error) {
    audit.log_read(audit_path, 0, offset, limit, false, reason);

    ReadFileResult r;
    r.success = false;
    r.path = result_path;
    r.offset = offset;
    r.limit = limit;
    r.error = error;
    return r;
}

// Read up to `count` bytes at `offset`, stopping early at end of file
int read_range(int fd, int64_t offset, int64_t count, std::string& out) {
    std::vector<char> buf(static_cast<size_t>(std::min<int64_t>(count, 65536)) + 1);
    int64_t done = 0;

    while (done < count) {
        size_t want = static_cast<size_t>(std::min<int64_t>(count - done,
                                                            static_cast<int64_t>(buf.size())));
        ssize_t n = ::pread(fd, &buf[0], want, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        if (n == 0) break;
        out.append(&buf[0], static_cast<size_t>(n));
        done += n;
    }
    return 0;
}

} // anonymous namespace

ReadFileResult read_file(const AirGapConfig& config,
                         const PathSecurityContext& security,
                         AuditLogger& audit,
                         const std::string& path,
                         int64_t offset,
                         int64_t limit) {
    int64_t effective_limit = limit;
    if (effective_limit < 0 || effective_limit > config.max_file_size_bytes) {
        effective_limit = config.max_file_size_bytes;
    }

    if (offset < 0) {
        return fail(audit, path, path, offset, effective_limit, "invalid_offset",
                    "offset must be non-negative");
    }

    PathValidationResult validation = security.validate_path(path);
    if (!validation.allowed) {
        LOG_DEBUG("read_file denied (%s): %s", denial_reason_str(validation.denial_reason),
                  path.c_str());
        return fail(audit, path, path, offset, effective_limit,
                    denial_reason_str(validation.denial_reason),
                    "Access denied: " + validation.denial_detail);
    }

    const std::string& canonical = validation.canonical_path;
    const FileSystem& fs = security.filesystem();

    int raw_fd = -1;
    int err = fs.open_read_nofollow(canonical, raw_fd);
    if (err != 0) {
        return fail(audit, canonical, canonical, offset, effective_limit,
                    open_failure_reason(err), std::string("Cannot open file: ") + strerror(err));
    }
    ScopedFd fd(raw_fd);

    FileStat st;
    err = fs.stat_fd(fd.get(), st);
    if (err != 0) {
        return fail(audit, canonical, canonical, offset, effective_limit, "os_error",
                    std::string("Cannot stat file: ") + strerror(err));
    }
    if (st.kind != FileKind::REGULAR) {
        return fail(audit, canonical, canonical, offset, effective_limit, "not_a_file",
                    "Path is not a file");
    }

    ReadFileResult result;
    result.success = true;
    result.path = canonical;
    result.has_content = true;
    result.offset = offset;
    result.limit = effective_limit;

    if (offset >= st.size) {
        audit.log_read(canonical, 0, offset, effective_limit, true);
        return result;
    }

    int64_t available = st.size - offset;
    int64_t to_read = std::min(available, effective_limit);
    result.truncated = available > effective_limit;

    std::string raw;
    err = read_range(fd.get(), offset, to_read, raw);
    if (err != 0) {
        return fail(audit, canonical, canonical, offset, effective_limit, "os_error",
                    std::string("Error reading file: ") + strerror(err));
    }
    result.bytes_read = static_cast<int64_t>(raw.size());

    result.content = is_valid_utf8(raw) ? raw : latin1_to_utf8(raw);

    if (static_cast<int64_t>(result.content.size()) > config.max_response_bytes) {
        result.content = truncate_safe(result.content,
                                       static_cast<size_t>(config.max_response_bytes));
        result.truncated = true;
    }

    audit.log_read(canonical, result.bytes_read, offset, effective_limit, true);
    return result;
}

} // namespace airgap
