/*
 * AirGap C++ - Utilities Implementation
 */
#include <airgap/core/utils.hpp>

#include <algorithm>
#include <numeric>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#include <openssl/sha.h>

namespace airgap {

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

// ============ Text encoding ============

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if malformed
static size_t utf8_sequence_length(const std::string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return 1;

    size_t expected;
    unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
    if (c >= 0xC2 && c <= 0xDF) {
        expected = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        expected = 3;
        if (c == 0xE0) lo = 0xA0;        // overlong
        if (c == 0xED) hi = 0x9F;        // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        expected = 4;
        if (c == 0xF0) lo = 0x90;        // overlong
        if (c == 0xF4) hi = 0x8F;        // > U+10FFFF
    } else {
        return 0;
    }

    if (i + expected > s.size()) return 0;

    unsigned char second = static_cast<unsigned char>(s[i + 1]);
    if (second < lo || second > hi) return 0;
    for (size_t j = 2; j < expected; ++j) {
        if ((static_cast<unsigned char>(s[i + j]) & 0xC0) != 0x80) return 0;
    }
    return expected;
}

bool is_valid_utf8(const std::string& s) {
    for (size_t i = 0; i < s.size(); ) {
        size_t len = utf8_sequence_length(s, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::string latin1_to_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 2);
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string replace_invalid_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        size_t len = utf8_sequence_length(s, i);
        if (len == 0) {
            out += "\xEF\xBF\xBD"; // U+FFFD
            ++i;
        } else {
            out.append(s, i, len);
            i += len;
        }
    }
    return out;
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;  // Back up if in the middle of a multi-byte sequence
    }
    return s.substr(0, len);
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return ".";

    bool absolute = path[0] == '/';
    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") {
            continue;
        }
        if (parts[i] == "..") {
            if (!result.empty() && result.back() != "..") {
                result.pop_back();
            } else if (!absolute) {
                result.push_back("..");
            }
        } else {
            result.push_back(parts[i]);
        }
    }

    std::string normalized = join(result, "/");
    if (absolute) {
        return "/" + normalized;
    }
    return normalized.empty() ? "." : normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string base_name(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    size_t slash = path.find('/');
    std::string user = path.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    std::string rest = (slash == std::string::npos) ? std::string() : path.substr(slash);

    std::string home;
    if (user.empty()) {
        const char* env_home = getenv("HOME");
        if (env_home && env_home[0] != '\0') {
            home = env_home;
        } else {
            struct passwd* pw = getpwuid(getuid());
            if (pw && pw->pw_dir) home = pw->pw_dir;
        }
    } else {
        struct passwd* pw = getpwnam(user.c_str());
        if (pw && pw->pw_dir) home = pw->pw_dir;
    }

    if (home.empty()) return path;
    if (home.size() > 1 && home.back() == '/') home.pop_back();
    return home + rest;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component

    std::string dir = filepath.substr(0, pos);

    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if ((dir[i] == '/' && i > 0) || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0700) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }

    return true;
}

// ============ Time utilities ============

std::string utc_timestamp_iso8601() {
    struct timeval tv;
    gettimeofday(&tv, NULL);
    time_t t = static_cast<time_t>(tv.tv_sec);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char out[48];
    snprintf(out, sizeof(out), "%s.%06ld+00:00", buf, static_cast<long>(tv.tv_usec));
    return std::string(out);
}

// ============ Hashing utilities ============

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace airgap
