/*
 * AirGap C++ - search_text Implementation
 */
#include <airgap/core/search_text.hpp>
#include <airgap/core/filesystem.hpp>
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <set>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace airgap {

Json SearchMatch::to_json() const {
    Json j;
    j["file_path"] = file_path;
    j["line_number"] = line_number;
    j["line_content"] = line_content;
    j["match_start"] = match_start;
    j["match_end"] = match_end;
    return j;
}

Json SearchResult::to_json() const {
    Json j;
    j["success"] = success;
    j["pattern"] = pattern;
    j["root_path"] = root_path;
    Json list = Json::array();
    for (size_t i = 0; i < matches.size(); ++i) {
        list.push_back(matches[i].to_json());
    }
    j["matches"] = list;
    j["files_scanned"] = files_scanned;
    j["method"] = method;
    j["truncated"] = truncated;
    j["timed_out"] = timed_out;
    j["error"] = error.empty() ? Json() : Json(error);
    return j;
}

namespace {

// Longest slice of a line handed to std::regex. The libstdc++ matcher
// recurses per consumed character, so longer input can exhaust the stack.
const size_t MAX_SCAN_LINE_BYTES = 2048;

// ============================================================================
// Lazy file walker
// ============================================================================

// Depth-first walk yielding authorized regular files. Files of a directory
// come first in enumeration order; its subdirectories are visited after the
// stream is exhausted. Only the current stream is open at any time.
class FileWalker {
public:
    FileWalker(const PathSecurityContext& security, TimeoutContext& timeout, int64_t max_files)
        : security_(security)
        , timeout_(timeout)
        , max_files_(max_files)
        , yielded_(0)
        , budget_exhausted_(false) {}

    void start(const std::string& root) {
        if (!push(root)) {
            LOG_WARN("search_text: cannot open search root");
        }
    }

    // Throws TimeoutExpired when a directory is entered past the deadline
    bool next(std::string& path, std::string& canonical) {
        const FileSystem& fs = security_.filesystem();

        while (!stack_.empty()) {
            Frame& top = stack_.back();

            if (top.stream) {
                DirEntryInfo info;
                if (top.stream->next(info)) {
                    std::string child = join_path(top.dir, info.name);

                    FileKind kind = info.kind;
                    if (!info.kind_known) {
                        FileStat st;
                        if (fs.lstat(child, st) != 0) continue;
                        kind = st.kind;
                    }

                    if (kind == FileKind::DIRECTORY) {
                        if (security_.is_entry_in_allowed_scope(child)) {
                            top.subdirs.push_back(info.name);
                        }
                        continue;
                    }
                    if (kind != FileKind::REGULAR && kind != FileKind::SYMLINK) {
                        continue;
                    }

                    PathValidationResult v = security_.validate_path(child);
                    if (!v.allowed) continue;

                    // Symlinks are searched only when they lead to a file
                    if (kind == FileKind::SYMLINK) {
                        FileStat st;
                        if (fs.stat(v.canonical_path, st) != 0 || st.kind != FileKind::REGULAR) {
                            continue;
                        }
                    }

                    if (yielded_ >= max_files_) {
                        budget_exhausted_ = true;
                        stack_.clear();
                        return false;
                    }

                    ++yielded_;
                    path = child;
                    canonical = v.canonical_path;
                    return true;
                }

                if (top.stream->error() != 0) {
                    LOG_DEBUG("search_text: directory read error: %s", strerror(top.stream->error()));
                }
                top.stream.reset();
            }

            if (top.next_subdir < top.subdirs.size()) {
                std::string dir = join_path(top.dir, top.subdirs[top.next_subdir++]);
                push(dir);
                continue;
            }

            stack_.pop_back();
        }
        return false;
    }

    int64_t files_yielded() const { return yielded_; }
    bool budget_exhausted() const { return budget_exhausted_; }

private:
    struct Frame {
        std::string dir;
        std::unique_ptr<DirectoryStream> stream;
        std::vector<std::string> subdirs;
        size_t next_subdir;

        Frame() : next_subdir(0) {}
    };

    bool push(const std::string& dir) {
        timeout_.check();

        Frame frame;
        int err = security_.filesystem().open_directory(dir, frame.stream);
        if (err != 0) {
            LOG_DEBUG("search_text: skipping unreadable directory: %s", strerror(err));
            return false;
        }
        frame.dir = dir;
        stack_.push_back(std::move(frame));
        return true;
    }

    const PathSecurityContext& security_;
    TimeoutContext& timeout_;
    int64_t max_files_;
    int64_t yielded_;
    bool budget_exhausted_;
    std::vector<Frame> stack_;
};

// Read at most `max_bytes` from an open descriptor
int read_all(int fd, int64_t max_bytes, std::string& out) {
    std::vector<char> buf(65536);
    while (static_cast<int64_t>(out.size()) < max_bytes) {
        size_t want = static_cast<size_t>(std::min<int64_t>(
            max_bytes - static_cast<int64_t>(out.size()), static_cast<int64_t>(buf.size())));
        ssize_t n = ::read(fd, &buf[0], want);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        if (n == 0) break;
        out.append(&buf[0], static_cast<size_t>(n));
    }
    return 0;
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// End offset of the match anchored at `start`, or start plus the pattern
// length if the compiled expression does not match there. At most
// MAX_SCAN_LINE_BYTES past `start` are examined.
int64_t match_end_at(const std::string& line, int64_t start, const std::regex& compiled,
                     const std::string& pattern) {
    int64_t fallback = start + static_cast<int64_t>(pattern.size());
    if (start < 0 || start > static_cast<int64_t>(line.size())) return fallback;

    size_t window_end = std::min(line.size(), static_cast<size_t>(start) + MAX_SCAN_LINE_BYTES);

    std::regex_constants::match_flag_type flags = std::regex_constants::match_continuous;
    if (start > 0) flags |= std::regex_constants::match_prev_avail;
    if (window_end < line.size()) flags |= std::regex_constants::match_not_eol;

    try {
        std::smatch m;
        if (std::regex_search(line.begin() + start, line.begin() + window_end, m, compiled, flags)) {
            return start + static_cast<int64_t>(m.length(0));
        }
    } catch (const std::regex_error& e) {
        LOG_DEBUG("search_text: re-match failed: %s", e.what());
    }
    return fallback;
}

// Byte offset `pos` of `raw` expressed as an offset into replace_invalid_utf8(raw)
int64_t replaced_offset(const std::string& raw, int64_t pos) {
    if (pos <= 0) return pos;
    size_t n = std::min(raw.size(), static_cast<size_t>(pos));
    int64_t mapped = static_cast<int64_t>(replace_invalid_utf8(raw.substr(0, n)).size());
    return mapped + (pos - static_cast<int64_t>(n));
}

void kill_and_reap(pid_t pid, bool kill_first, int& status) {
    if (kill_first && ::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("ripgrep: kill failed: %s", strerror(errno));
    }
    status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG_WARN("ripgrep: waitpid failed: %s", strerror(errno));
            break;
        }
    }
}

} // anonymous namespace

// ============================================================================
// ripgrep output parsing
// ============================================================================

bool parse_ripgrep_line(const std::string& line, const std::string& root,
                        std::string& path, int64_t& line_number, int64_t& column,
                        std::string& content) {
    if (!starts_with(line, root)) return false;

    const size_t n = line.size();
    size_t pos = root.size();
    while ((pos = line.find(':', pos)) != std::string::npos) {
        size_t a = pos + 1;
        size_t b = a;
        while (b < n && isdigit(static_cast<unsigned char>(line[b]))) ++b;

        if (b > a && b - a <= 18 && b < n && line[b] == ':') {
            size_t c = b + 1;
            size_t d = c;
            while (d < n && isdigit(static_cast<unsigned char>(line[d]))) ++d;

            if (d > c && d - c <= 18 && d < n && line[d] == ':') {
                path = line.substr(0, pos);
                line_number = strtoll(line.substr(a, b - a).c_str(), NULL, 10);
                column = strtoll(line.substr(c, d - c).c_str(), NULL, 10);
                content = line.substr(d + 1);
                return true;
            }
        }
        ++pos;
    }
    return false;
}

// ============================================================================
// RipgrepBackend
// ============================================================================

RipgrepBackend::RipgrepBackend(const AirGapConfig& config, const PathSecurityContext& security,
                               const std::string& executable)
    : config_(config)
    , security_(security)
    , executable_(executable) {}

std::string RipgrepBackend::locate(const std::string& configured) {
    if (!configured.empty()) {
        if (is_executable_file(configured)) return configured;
        LOG_WARN("Configured ripgrep is not an executable file: %s", configured.c_str());
        return "";
    }

    const char* env_path = getenv("PATH");
    if (!env_path) return "";

    std::vector<std::string> dirs = split(env_path, ':');
    for (size_t i = 0; i < dirs.size(); ++i) {
        if (dirs[i].empty()) continue;
        std::string candidate = join_path(dirs[i], "rg");
        if (is_executable_file(candidate)) return candidate;
    }
    return "";
}

std::vector<std::string> RipgrepBackend::build_argv(const std::string& root,
                                                    const std::string& pattern) const {
    std::vector<std::string> argv;
    argv.push_back(executable_);
    argv.push_back("--no-config");
    argv.push_back("--no-follow");
    argv.push_back("--no-heading");
    argv.push_back("--with-filename");
    argv.push_back("--line-number");
    argv.push_back("--column");
    argv.push_back("--color");
    argv.push_back("never");
    argv.push_back("--max-count");
    argv.push_back(std::to_string(config_.max_results));
    argv.push_back("--max-filesize");
    argv.push_back(std::to_string(config_.max_file_size_bytes));
    argv.push_back("--");
    argv.push_back(pattern);
    argv.push_back(root);
    return argv;
}

bool RipgrepBackend::search(const std::string& root, const std::string& pattern,
                            const std::regex& compiled, TimeoutContext& timeout,
                            SearchResult& out) {
    out.method = method();

    std::vector<std::string> args = build_argv(root, pattern);
    std::vector<char*> argv;
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(NULL);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        LOG_WARN("ripgrep: pipe failed: %s", strerror(errno));
        return false;
    }
    ScopedFd read_end(pipefd[0]);
    ScopedFd write_end(pipefd[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = -1;
    int rc = posix_spawn(&pid, executable_.c_str(), &actions, NULL, &argv[0], environ);
    posix_spawn_file_actions_destroy(&actions);
    write_end.reset();

    if (rc != 0) {
        LOG_WARN("ripgrep: spawn failed: %s", strerror(rc));
        return false;
    }

    std::set<std::string> files_seen;
    std::string pending;
    std::vector<char> buf(65536);
    bool at_cap = false;
    bool timed_out = false;
    bool failed = false;
    bool eof = false;

    // Returns true once max_results is reached
    auto accept = [&](const std::string& raw_line) -> bool {
        std::string file_path;
        int64_t line_number = 0;
        int64_t column = 0;
        std::string content;
        if (!parse_ripgrep_line(raw_line, root, file_path, line_number, column, content)) {
            return false;
        }
        if (!security_.validate_path(file_path).allowed) {
            return false;
        }

        while (!content.empty() && content.back() == '\r') content.pop_back();

        SearchMatch match;
        match.file_path = file_path;
        match.line_number = line_number;
        int64_t raw_start = column - 1;
        int64_t raw_end = match_end_at(content, raw_start, compiled, pattern);
        match.match_start = replaced_offset(content, raw_start);
        match.match_end = replaced_offset(content, raw_end);
        match.line_content = replace_invalid_utf8(content);

        files_seen.insert(file_path);
        out.matches.push_back(match);
        return static_cast<int64_t>(out.matches.size()) >= config_.max_results;
    };

    while (!at_cap && !eof) {
        double remaining = timeout.remaining();
        if (remaining <= 0.0) {
            timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = read_end.get();
        pfd.events = POLLIN;
        pfd.revents = 0;

        double wait_ms = std::ceil(remaining * 1000.0);
        int poll_ms = wait_ms > static_cast<double>(INT_MAX) ? INT_MAX : static_cast<int>(wait_ms);
        int pr = ::poll(&pfd, 1, poll_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("ripgrep: poll failed: %s", strerror(errno));
            failed = true;
            break;
        }
        if (pr == 0) continue;

        ssize_t n = ::read(read_end.get(), &buf[0], buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_WARN("ripgrep: read failed: %s", strerror(errno));
            failed = true;
            break;
        }
        if (n == 0) {
            eof = true;
            if (!pending.empty()) {
                at_cap = accept(pending);
                pending.clear();
            }
            break;
        }

        pending.append(&buf[0], static_cast<size_t>(n));
        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, nl - start);
            start = nl + 1;
            if (accept(line)) {
                at_cap = true;
                break;
            }
            if (timeout.is_expired()) {
                timed_out = true;
                break;
            }
        }
        pending.erase(0, start);
        if (timed_out) break;
    }

    int status = 0;
    kill_and_reap(pid, !eof, status);

    if (timed_out) {
        LOG_WARN("ripgrep: timed out after %.2fs", timeout.elapsed());
        return false;
    }
    if (failed) {
        return false;
    }
    if (!at_cap) {
        // 0 = matches, 1 = no matches, >= 2 = error
        if (!WIFEXITED(status) || WEXITSTATUS(status) >= 2) {
            LOG_WARN("ripgrep: exited abnormally (status %d)", status);
            return false;
        }
    }

    out.truncated = at_cap;
    out.files_scanned = static_cast<int64_t>(files_seen.size());
    return true;
}

// ============================================================================
// EmbeddedBackend
// ============================================================================

EmbeddedBackend::EmbeddedBackend(const AirGapConfig& config, const PathSecurityContext& security)
    : config_(config)
    , security_(security) {}

bool EmbeddedBackend::search(const std::string& root, const std::string& pattern,
                             const std::regex& compiled, TimeoutContext& timeout,
                             SearchResult& out) {
    (void)pattern;
    out.method = method();

    FileWalker walker(security_, timeout, config_.max_files_scanned);
    try {
        walker.start(root);

        std::string path;
        std::string canonical;
        while (walker.next(path, canonical)) {
            timeout.check();
            search_file(path, canonical, compiled, timeout, out);
            if (static_cast<int64_t>(out.matches.size()) >= config_.max_results) {
                out.truncated = true;
                break;
            }
        }
        if (walker.budget_exhausted()) {
            out.truncated = true;
        }
    } catch (const TimeoutExpired& e) {
        LOG_DEBUG("search_text: %s", e.what());
        out.timed_out = true;
    }

    out.files_scanned = walker.files_yielded();
    return true;
}

void EmbeddedBackend::search_file(const std::string& display_path,
                                  const std::string& canonical_path,
                                  const std::regex& compiled, TimeoutContext& timeout,
                                  SearchResult& out) {
    const FileSystem& fs = security_.filesystem();

    int raw_fd = -1;
    int err = fs.open_read_nofollow(canonical_path, raw_fd);
    if (err != 0) {
        LOG_DEBUG("search_text: cannot open file: %s", strerror(err));
        return;
    }
    ScopedFd fd(raw_fd);

    FileStat st;
    if (fs.stat_fd(fd.get(), st) != 0 || st.kind != FileKind::REGULAR) {
        return;
    }
    if (st.size > config_.max_file_size_bytes) {
        LOG_DEBUG("search_text: skipping file over size limit (%lld bytes)",
                  static_cast<long long>(st.size));
        return;
    }

    std::string data;
    err = read_all(fd.get(), config_.max_file_size_bytes, data);
    if (err != 0) {
        LOG_DEBUG("search_text: read failed: %s", strerror(err));
        return;
    }

    int64_t line_number = 0;
    size_t pos = 0;
    while (pos < data.size()) {
        timeout.check();

        size_t nl = data.find('\n', pos);
        size_t end = (nl == std::string::npos) ? data.size() : nl;
        std::string raw_line = data.substr(pos, end - pos);
        pos = (nl == std::string::npos) ? data.size() : nl + 1;
        ++line_number;

        while (!raw_line.empty() && raw_line.back() == '\r') raw_line.pop_back();

        // Only the head of an over-long line is searched
        bool clipped = false;
        if (raw_line.size() > MAX_SCAN_LINE_BYTES) {
            raw_line = truncate_safe(raw_line, MAX_SCAN_LINE_BYTES);
            clipped = true;
        }
        std::string line = replace_invalid_utf8(raw_line);
        if (line.size() > MAX_SCAN_LINE_BYTES) {
            line = truncate_safe(line, MAX_SCAN_LINE_BYTES);
            clipped = true;
        }
        if (clipped) {
            LOG_DEBUG("search_text: line %lld clipped to %zu bytes",
                      static_cast<long long>(line_number), line.size());
            out.truncated = true;
        }

        std::regex_constants::match_flag_type flags = std::regex_constants::match_default;
        if (clipped) flags |= std::regex_constants::match_not_eol;

        try {
            std::sregex_iterator it(line.begin(), line.end(), compiled, flags);
            std::sregex_iterator last;
            for (; it != last; ++it) {
                SearchMatch match;
                match.file_path = display_path;
                match.line_number = line_number;
                match.match_start = static_cast<int64_t>(it->position(0));
                match.match_end = match.match_start + static_cast<int64_t>(it->length(0));
                match.line_content = line;
                out.matches.push_back(match);

                if (static_cast<int64_t>(out.matches.size()) >= config_.max_results) {
                    return;
                }
            }
        } catch (const std::regex_error& e) {
            LOG_WARN("search_text: regex evaluation aborted, skipping rest of file: %s", e.what());
            return;
        }
    }
}

// ============================================================================
// TextSearcher
// ============================================================================

TextSearcher::TextSearcher(const AirGapConfig& config, const PathSecurityContext& security,
                           AuditLogger& audit)
    : config_(config)
    , security_(security)
    , audit_(audit)
    , embedded_(config, security)
{
    if (config_.prefer_ripgrep) {
        std::string executable = RipgrepBackend::locate(config_.ripgrep_path);
        if (!executable.empty()) {
            ripgrep_.reset(new RipgrepBackend(config_, security_, executable));
            LOG_DEBUG("search_text: using ripgrep at %s", executable.c_str());
        } else {
            LOG_INFO("ripgrep not found, using embedded search");
        }
    }
}

SearchResult TextSearcher::search_text(const std::string& root, const std::string& pattern) {
    SearchResult result;
    result.pattern = pattern;
    result.root_path = root;

    PathValidationResult validation = security_.validate_path(root);
    if (!validation.allowed) {
        LOG_DEBUG("search_text denied (%s): %s", denial_reason_str(validation.denial_reason),
                  root.c_str());
        audit_.log_search(root, pattern, 0, 0, "none", false,
                          denial_reason_str(validation.denial_reason));
        result.error = "Access denied: " + validation.denial_detail;
        return result;
    }

    const std::string& canonical = validation.canonical_path;
    result.root_path = canonical;

    FileStat st;
    int err = security_.filesystem().stat(canonical, st);
    if (err != 0 || st.kind != FileKind::DIRECTORY) {
        const char* reason = (err == ENOENT || err == ENOTDIR)
            ? denial_reason_str(PathDenialReason::NOT_EXISTS) : "not_a_directory";
        audit_.log_search(canonical, pattern, 0, 0, "none", false, reason);
        result.error = "Path is not a directory";
        return result;
    }

    std::regex compiled;
    try {
        compiled.assign(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        audit_.log_search(canonical, pattern, 0, 0, "none", false, "invalid_pattern");
        result.error = std::string("Invalid regex pattern: ") + e.what();
        return result;
    }

    TimeoutContext timeout(config_.timeout_seconds);

    SearchResult found;
    bool done = false;
    if (ripgrep_) {
        done = ripgrep_->search(canonical, pattern, compiled, timeout, found);
        if (!done) {
            LOG_INFO("ripgrep search failed, falling back to embedded search");
            found = SearchResult();
        }
    }
    if (!done) {
        embedded_.search(canonical, pattern, compiled, timeout, found);
    }

    result.success = true;
    result.matches.swap(found.matches);
    result.files_scanned = found.files_scanned;
    result.method = found.method;
    result.truncated = found.truncated;
    result.timed_out = found.timed_out;

    audit_.log_search(canonical, pattern, result.files_scanned,
                      static_cast<int64_t>(result.matches.size()), result.method, true, "",
                      result.timed_out);
    return result;
}

} // namespace airgap
