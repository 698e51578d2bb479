/*
 * AirGap C++ - Sandbox configuration
 *
 * Immutable-after-load settings consumed by the security layer and the
 * three file operations. Defaults are deny-by-default: no allowed roots
 * means nothing is accessible.
 */
#ifndef airgap_CORE_AIRGAP_CONFIG_HPP
#define airgap_CORE_AIRGAP_CONFIG_HPP

#include "config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace airgap {

// Sensitive filename patterns blocked unless the config overrides the list
const std::vector<std::string>& default_blocked_patterns();

struct AirGapConfig {
    std::vector<std::string> allowed_roots;

    int64_t max_file_size_bytes;    // per-file read / scan ceiling
    int64_t max_response_bytes;     // returned payload ceiling
    int64_t max_results;            // entries or matches per call
    int64_t max_files_scanned;      // search traversal budget
    double timeout_seconds;

    std::string audit_log_path;     // empty = audit records are not persisted
    bool redact_paths_in_audit;

    std::vector<std::string> blocked_patterns;

    // Search backend selection
    bool prefer_ripgrep;
    std::string ripgrep_path;       // empty = look up "rg" on PATH

    AirGapConfig();

    // Check every limit is positive. Returns false with a message otherwise.
    bool validate(std::string& error) const;

    // Build from a config document. Keys are read from the "airgap" section
    // when present, otherwise from the top level; search options come from
    // "search.prefer_ripgrep" / "search.ripgrep_path". Keys of the wrong
    // JSON type are rejected rather than silently defaulted.
    static bool load(const Config& cfg, AirGapConfig& out, std::string& error);
};

} // namespace airgap

#endif // airgap_CORE_AIRGAP_CONFIG_HPP
