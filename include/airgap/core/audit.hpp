/*
 * AirGap C++ - Audit Logger
 *
 * Metadata-only JSON-lines audit trail. File content and raw search
 * patterns are never written; paths are replaced by a truncated SHA-256
 * digest when redaction is enabled.
 *
 * A record is appended with a single write(2) on an O_APPEND descriptor.
 * Write failures are reported through the diagnostic logger and never
 * reach the caller.
 */
#ifndef airgap_CORE_AUDIT_HPP
#define airgap_CORE_AUDIT_HPP

#include "airgap_config.hpp"
#include "json.hpp"
#include <string>
#include <mutex>
#include <cstdint>

namespace airgap {

struct AuditEntry {
    std::string timestamp;
    std::string operation;
    std::string path;           // empty when redacted or absent
    std::string path_hash;      // empty unless redacted
    bool success;
    std::string denial_reason;  // empty = null
    Json metadata;

    AuditEntry() : success(true), metadata(Json::object()) {}

    Json to_json() const;
};

class AuditLogger {
public:
    explicit AuditLogger(const AirGapConfig& config);

    // Build an entry, append it to the log (if configured) and return it
    AuditEntry log(const std::string& operation, const std::string& path, bool success,
                   const std::string& denial_reason, const Json& metadata);

    // bytes_read is what was actually transferred, never the file size
    AuditEntry log_read(const std::string& path, int64_t bytes_read, int64_t offset,
                        int64_t limit, bool success = true,
                        const std::string& denial_reason = "");

    AuditEntry log_list_dir(const std::string& path, int64_t entry_count,
                            bool success = true, const std::string& denial_reason = "");

    // The pattern is recorded only as pattern_hash
    AuditEntry log_search(const std::string& path, const std::string& pattern,
                          int64_t files_scanned, int64_t matches_found,
                          const std::string& method, bool success = true,
                          const std::string& denial_reason = "", bool timed_out = false);

    AuditEntry log_denied(const std::string& operation, const std::string& path,
                          const std::string& reason);

    // First 16 hex chars of SHA-256
    static std::string hash_value(const std::string& value);

    const std::string& log_path() const { return log_path_; }

private:
    void append(const std::string& line);

    std::string log_path_;
    bool redact_paths_;
    std::mutex mutex_;
};

} // namespace airgap

#endif // airgap_CORE_AUDIT_HPP
