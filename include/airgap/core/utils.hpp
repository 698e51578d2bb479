/*
 * AirGap C++ - Utilities
 *
 * String, text-encoding, path, time and hashing helpers shared by the
 * security layer and the tool operations.
 */
#ifndef airgap_CORE_UTILS_HPP
#define airgap_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace airgap {

// ============ String utilities ============

std::string trim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter (keeps empty parts, "a//b" -> {"a", "", "b"})
std::vector<std::string> split(const std::string& s, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Text encoding ============

// True if `s` is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF)
bool is_valid_utf8(const std::string& s);

// Interpret every byte as ISO-8859-1 and re-encode as UTF-8. Never fails.
std::string latin1_to_utf8(const std::string& s);

// Replace each malformed UTF-8 sequence with U+FFFD; control characters
// are kept as-is.
std::string replace_invalid_utf8(const std::string& s);

// Truncate to at most max_len bytes without splitting a multi-byte sequence
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Lexical normalization: collapse "//", ".", and ".." (no filesystem access)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Last path component ("/a/b" -> "b", "/" -> "")
std::string base_name(const std::string& path);

// Expand a leading "~" or "~user". Returns the input unchanged when the
// home directory cannot be determined.
std::string expand_user(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ Time utilities ============

// ISO 8601 UTC timestamp with microseconds: 2024-01-31T12:00:00.123456+00:00
std::string utc_timestamp_iso8601();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

} // namespace airgap

#endif // airgap_CORE_UTILS_HPP
