/*
 * AirGap C++ - Audit Logger Implementation
 */
#include <airgap/core/audit.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace airgap {

Json AuditEntry::to_json() const {
    Json j;
    j["timestamp"] = timestamp;
    j["operation"] = operation;
    j["path"] = path.empty() ? Json() : Json(path);
    j["path_hash"] = path_hash.empty() ? Json() : Json(path_hash);
    j["success"] = success;
    j["denial_reason"] = denial_reason.empty() ? Json() : Json(denial_reason);
    j["metadata"] = metadata;
    return j;
}

AuditLogger::AuditLogger(const AirGapConfig& config)
    : log_path_(config.audit_log_path)
    , redact_paths_(config.redact_paths_in_audit)
{
    if (!log_path_.empty()) {
        if (!create_parent_directory(log_path_)) {
            LOG_WARN("Cannot create audit log directory for %s", log_path_.c_str());
        }
        LOG_DEBUG("Audit log: %s (redact_paths=%s)", log_path_.c_str(),
                  redact_paths_ ? "true" : "false");
    }
}

std::string AuditLogger::hash_value(const std::string& value) {
    return sha256_hex(value).substr(0, 16);
}

AuditEntry AuditLogger::log(const std::string& operation, const std::string& path, bool success,
                            const std::string& denial_reason, const Json& metadata) {
    AuditEntry entry;
    entry.timestamp = utc_timestamp_iso8601();
    entry.operation = operation;
    entry.success = success;
    entry.denial_reason = denial_reason;
    if (metadata.is_object()) {
        entry.metadata = metadata;
    }

    if (!path.empty()) {
        if (redact_paths_) {
            entry.path_hash = hash_value(path);
        } else {
            entry.path = path;
        }
    }

    if (!log_path_.empty()) {
        // Invalid UTF-8 in a path must not make dump() throw
        append(entry.to_json().dump(-1, ' ', false, Json::error_handler_t::replace) + "\n");
    }
    return entry;
}

void AuditLogger::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);

    int fd = ::open(log_path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_WARN("Audit log open failed: %s", strerror(errno));
        return;
    }

    ssize_t written;
    do {
        written = ::write(fd, line.data(), line.size());
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        LOG_WARN("Audit log write failed: %s", strerror(errno));
    } else if (static_cast<size_t>(written) != line.size()) {
        LOG_WARN("Audit log short write (%zd of %zu bytes)", written, line.size());
    }

    if (::close(fd) != 0) {
        LOG_WARN("Audit log close failed: %s", strerror(errno));
    }
}

AuditEntry AuditLogger::log_read(const std::string& path, int64_t bytes_read, int64_t offset,
                                 int64_t limit, bool success, const std::string& denial_reason) {
    Json meta;
    meta["bytes_read"] = bytes_read;
    meta["offset"] = offset;
    meta["limit"] = limit;
    return log("read_file", path, success, denial_reason, meta);
}

AuditEntry AuditLogger::log_list_dir(const std::string& path, int64_t entry_count,
                                     bool success, const std::string& denial_reason) {
    Json meta;
    meta["entry_count"] = entry_count;
    return log("list_dir", path, success, denial_reason, meta);
}

AuditEntry AuditLogger::log_search(const std::string& path, const std::string& pattern,
                                   int64_t files_scanned, int64_t matches_found,
                                   const std::string& method, bool success,
                                   const std::string& denial_reason, bool timed_out) {
    Json meta;
    meta["pattern_hash"] = hash_value(pattern);
    meta["files_scanned"] = files_scanned;
    meta["matches_found"] = matches_found;
    meta["method"] = method;
    meta["timed_out"] = timed_out;
    return log("search_text", path, success, denial_reason, meta);
}

AuditEntry AuditLogger::log_denied(const std::string& operation, const std::string& path,
                                   const std::string& reason) {
    return log(operation, path, false, reason, Json::object());
}

} // namespace airgap
