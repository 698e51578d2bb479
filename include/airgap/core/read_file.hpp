/*
 * AirGap C++ - read_file operation
 *
 * Reads a byte range of one file inside the allowed roots. The path is
 * authorized before any filesystem call, the file is opened without
 * following a final symlink, and the audit record carries the bytes that
 * were actually read.
 */
#ifndef airgap_CORE_READ_FILE_HPP
#define airgap_CORE_READ_FILE_HPP

#include "airgap_config.hpp"
#include "path_security.hpp"
#include "audit.hpp"
#include "json.hpp"
#include <string>
#include <cstdint>

namespace airgap {

struct ReadFileResult {
    bool success;
    std::string path;       // canonical path once validated, else the request
    std::string content;
    bool has_content;       // false serializes content as null
    int64_t bytes_read;
    int64_t offset;
    int64_t limit;
    bool truncated;
    std::string error;

    ReadFileResult()
        : success(false), has_content(false), bytes_read(0), offset(0), limit(0),
          truncated(false) {}

    Json to_json() const;
};

// `limit` < 0 selects max_file_size_bytes; larger values are clamped to it.
ReadFileResult read_file(const AirGapConfig& config,
                         const PathSecurityContext& security,
                         AuditLogger& audit,
                         const std::string& path,
                         int64_t offset = 0,
                         int64_t limit = -1);

} // namespace airgap

#endif // airgap_CORE_READ_FILE_HPP
