/*
 * AirGap C++ - Test helpers
 *
 * TempTree creates a scratch directory under /tmp and removes it on
 * destruction. RecordingFileSystem forwards to the POSIX filesystem and
 * records every path that was queried.
 */
#ifndef airgap_TESTS_TEST_HELPERS_HPP
#define airgap_TESTS_TEST_HELPERS_HPP

#include <airgap/core/airgap_config.hpp>
#include <airgap/core/filesystem.hpp>
#include <airgap/core/logger.hpp>

#include <gtest/gtest.h>

#include <climits>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace airgap {
namespace test {

class TempTree {
public:
    TempTree() {
        char tmpl[] = "/tmp/airgap-test-XXXXXX";
        char* made = mkdtemp(tmpl);
        if (made) {
            char resolved[PATH_MAX];
            root_ = realpath(made, resolved) ? std::string(resolved) : std::string(made);
        }
    }

    ~TempTree() {
        if (!root_.empty()) {
            nftw(root_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string& root() const { return root_; }

    std::string path(const std::string& rel) const {
        return rel.empty() ? root_ : root_ + "/" + rel;
    }

    std::string make_dir(const std::string& rel) const {
        std::string full = path(rel);
        mkdir(full.c_str(), 0755);
        return full;
    }

    std::string write_file(const std::string& rel, const std::string& content) const {
        std::string full = path(rel);
        std::ofstream out(full.c_str(), std::ios::binary | std::ios::trunc);
        out << content;
        return full;
    }

    // Create `rel` as a symlink pointing at `target` (absolute or relative)
    std::string make_symlink(const std::string& target, const std::string& rel) const {
        std::string full = path(rel);
        if (symlink(target.c_str(), full.c_str()) != 0) {
            ADD_FAILURE() << "symlink failed: " << full;
        }
        return full;
    }

private:
    static int remove_entry(const char* p, const struct stat*, int, struct FTW*) {
        return ::remove(p);
    }

    TempTree(const TempTree&);
    TempTree& operator=(const TempTree&);

    std::string root_;
};

inline AirGapConfig config_for(const std::string& root) {
    AirGapConfig cfg;
    cfg.allowed_roots.push_back(root);
    cfg.prefer_ripgrep = false;
    return cfg;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path.c_str(), std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path.c_str());
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// Keeps test output free of expected warnings
class QuietLogs {
public:
    QuietLogs() : saved_(Logger::instance().level()) {
        Logger::instance().set_level(LogLevel::ERROR);
    }
    ~QuietLogs() { Logger::instance().set_level(saved_); }

private:
    LogLevel saved_;
};

class RecordingFileSystem : public FileSystem {
public:
    int lstat(const std::string& path, FileStat& out) const override {
        lstat_calls.push_back(path);
        return real_.lstat(path, out);
    }
    int stat(const std::string& path, FileStat& out) const override {
        stat_calls.push_back(path);
        return real_.stat(path, out);
    }
    int read_link(const std::string& path, std::string& target) const override {
        readlink_calls.push_back(path);
        return real_.read_link(path, target);
    }
    int current_dir(std::string& out) const override {
        return real_.current_dir(out);
    }
    int open_directory(const std::string& path,
                       std::unique_ptr<DirectoryStream>& out) const override {
        return real_.open_directory(path, out);
    }
    int open_read_nofollow(const std::string& path, int& fd) const override {
        return real_.open_read_nofollow(path, fd);
    }
    int stat_fd(int fd, FileStat& out) const override {
        return real_.stat_fd(fd, out);
    }

    // True if `path` was passed to any metadata call
    bool touched(const std::string& path) const {
        return contains(lstat_calls, path) || contains(stat_calls, path) ||
               contains(readlink_calls, path);
    }

    void clear() const {
        lstat_calls.clear();
        stat_calls.clear();
        readlink_calls.clear();
    }

    mutable std::vector<std::string> lstat_calls;
    mutable std::vector<std::string> stat_calls;
    mutable std::vector<std::string> readlink_calls;

private:
    static bool contains(const std::vector<std::string>& v, const std::string& s) {
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] == s) return true;
        }
        return false;
    }

    PosixFileSystem real_;
};

} // namespace test
} // namespace airgap

#endif // airgap_TESTS_TEST_HELPERS_HPP
