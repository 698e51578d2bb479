/*
 * AirGap C++ - search_text operation
 *
 * Regex search under one allowed directory, bounded by max_results,
 * max_files_scanned, max_file_size_bytes and a per-call timeout.
 *
 * Two interchangeable backends:
 *   - RipgrepBackend: spawns `rg` with a fixed argv (no shell) and
 *     re-authorizes every reported file.
 *   - EmbeddedBackend: lazy depth-first walk with std::regex.
 * The ripgrep backend is tried first when configured and found; any
 * failure to produce a result falls back to the embedded backend.
 */
#ifndef airgap_CORE_SEARCH_TEXT_HPP
#define airgap_CORE_SEARCH_TEXT_HPP

#include "airgap_config.hpp"
#include "path_security.hpp"
#include "audit.hpp"
#include "timeout.hpp"
#include "json.hpp"
#include <string>
#include <vector>
#include <regex>
#include <memory>
#include <cstdint>

namespace airgap {

struct SearchMatch {
    std::string file_path;
    int64_t line_number;        // 1-based
    int64_t match_start;        // byte offsets into line_content
    int64_t match_end;
    std::string line_content;   // line terminator stripped, valid UTF-8

    SearchMatch() : line_number(0), match_start(0), match_end(0) {}

    Json to_json() const;
};

struct SearchResult {
    bool success;
    std::string pattern;
    std::string root_path;
    std::vector<SearchMatch> matches;
    int64_t files_scanned;
    std::string method;         // "ripgrep", "embedded", "none"
    bool truncated;
    bool timed_out;
    std::string error;

    SearchResult() : success(false), files_scanned(0), method("none"),
                     truncated(false), timed_out(false) {}

    Json to_json() const;
};

class SearchBackend {
public:
    virtual ~SearchBackend() {}

    virtual const char* method() const = 0;

    // Fill matches, files_scanned, truncated and timed_out for an authorized
    // directory. Returns false when the backend could not run to a usable
    // result, leaving `out` for the caller to discard.
    virtual bool search(const std::string& root, const std::string& pattern,
                        const std::regex& compiled, TimeoutContext& timeout,
                        SearchResult& out) = 0;
};

class RipgrepBackend : public SearchBackend {
public:
    RipgrepBackend(const AirGapConfig& config, const PathSecurityContext& security,
                   const std::string& executable);

    const char* method() const override { return "ripgrep"; }
    bool search(const std::string& root, const std::string& pattern,
                const std::regex& compiled, TimeoutContext& timeout,
                SearchResult& out) override;

    // Fixed argument vector; the pattern is always after "--"
    std::vector<std::string> build_argv(const std::string& root,
                                        const std::string& pattern) const;

    // Locate the executable: `configured` if set, else "rg" on PATH.
    // Returns "" when not found.
    static std::string locate(const std::string& configured);

private:
    const AirGapConfig& config_;
    const PathSecurityContext& security_;
    std::string executable_;
};

class EmbeddedBackend : public SearchBackend {
public:
    EmbeddedBackend(const AirGapConfig& config, const PathSecurityContext& security);

    const char* method() const override { return "embedded"; }
    bool search(const std::string& root, const std::string& pattern,
                const std::regex& compiled, TimeoutContext& timeout,
                SearchResult& out) override;

private:
    // Scan one open file line by line
    void search_file(const std::string& display_path, const std::string& canonical_path,
                     const std::regex& compiled, TimeoutContext& timeout,
                     SearchResult& out);

    const AirGapConfig& config_;
    const PathSecurityContext& security_;
};

// Parse one ripgrep output line "path:line:column:content". The path must
// start with `root`, which disambiguates colons inside file names.
bool parse_ripgrep_line(const std::string& line, const std::string& root,
                        std::string& path, int64_t& line_number, int64_t& column,
                        std::string& content);

class TextSearcher {
public:
    // ripgrep is probed once here when config.prefer_ripgrep is set
    TextSearcher(const AirGapConfig& config, const PathSecurityContext& security,
                 AuditLogger& audit);

    SearchResult search_text(const std::string& root, const std::string& pattern);

    bool ripgrep_available() const { return ripgrep_ != nullptr; }

private:
    const AirGapConfig& config_;
    const PathSecurityContext& security_;
    AuditLogger& audit_;
    std::unique_ptr<RipgrepBackend> ripgrep_;
    EmbeddedBackend embedded_;
};

} // namespace airgap

#endif // airgap_CORE_SEARCH_TEXT_HPP
