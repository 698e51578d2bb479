/*
 * AirGap C++ - list_dir operation
 *
 * Streams one directory and describes each entry. An entry is authorized
 * lexically before anything is learned about it: a denied entry is never
 * statted, and a symlink's target is authorized before it is queried.
 */
#ifndef airgap_CORE_LIST_DIR_HPP
#define airgap_CORE_LIST_DIR_HPP

#include "airgap_config.hpp"
#include "path_security.hpp"
#include "audit.hpp"
#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace airgap {

struct DirectoryEntry {
    std::string name;
    std::string path;
    std::string type;           // "file", "directory", "symlink", "unknown"
    bool accessible;
    int64_t size;               // -1 = omitted (only files carry a size)
    std::string denial_reason;  // empty = omitted

    DirectoryEntry() : type("unknown"), accessible(false), size(-1) {}

    // Absent fields are left out rather than serialized as null
    Json to_json() const;
};

struct ListDirResult {
    bool success;
    std::string path;
    std::vector<DirectoryEntry> entries;
    bool truncated;
    std::string error;

    ListDirResult() : success(false), truncated(false) {}

    Json to_json() const;
};

ListDirResult list_dir(const AirGapConfig& config,
                       const PathSecurityContext& security,
                       AuditLogger& audit,
                       const std::string& path);

} // namespace airgap

#endif // airgap_CORE_LIST_DIR_HPP
