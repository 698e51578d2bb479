/*
 * AirGap C++ - POSIX filesystem implementation
 */
#include <airgap/core/filesystem.hpp>

#include <cerrno>
#include <climits>
#include <vector>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace airgap {

static FileKind kind_from_mode(mode_t mode) {
    if (S_ISREG(mode)) return FileKind::REGULAR;
    if (S_ISDIR(mode)) return FileKind::DIRECTORY;
    if (S_ISLNK(mode)) return FileKind::SYMLINK;
    return FileKind::OTHER;
}

static void fill_stat(const struct stat& st, FileStat& out) {
    out.kind = kind_from_mode(st.st_mode);
    out.size = static_cast<int64_t>(st.st_size);
}

// ============================================================================
// PosixDirectoryStream
// ============================================================================

namespace {

class PosixDirectoryStream : public DirectoryStream {
public:
    explicit PosixDirectoryStream(DIR* dir) : dir_(dir), error_(0) {}

    ~PosixDirectoryStream() override {
        if (dir_) closedir(dir_);
    }

    bool next(DirEntryInfo& out) override {
        if (!dir_ || error_ != 0) return false;

        for (;;) {
            errno = 0;
            struct dirent* entry = readdir(dir_);
            if (!entry) {
                error_ = errno;  // 0 at end of stream
                return false;
            }

            const char* name = entry->d_name;
            if (name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0'))) {
                continue;
            }

            out.name = name;
            out.kind_known = true;
            switch (entry->d_type) {
                case DT_REG: out.kind = FileKind::REGULAR; break;
                case DT_DIR: out.kind = FileKind::DIRECTORY; break;
                case DT_LNK: out.kind = FileKind::SYMLINK; break;
                case DT_UNKNOWN:
                    out.kind = FileKind::OTHER;
                    out.kind_known = false;
                    break;
                default: out.kind = FileKind::OTHER; break;
            }
            return true;
        }
    }

    int error() const override { return error_; }

private:
    DIR* dir_;
    int error_;
};

} // anonymous namespace

// ============================================================================
// PosixFileSystem
// ============================================================================

int PosixFileSystem::lstat(const std::string& path, FileStat& out) const {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) return errno;
    fill_stat(st, out);
    return 0;
}

int PosixFileSystem::stat(const std::string& path, FileStat& out) const {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return errno;
    fill_stat(st, out);
    return 0;
}

int PosixFileSystem::read_link(const std::string& path, std::string& target) const {
    std::vector<char> buf(PATH_MAX);
    for (;;) {
        ssize_t len = ::readlink(path.c_str(), &buf[0], buf.size());
        if (len < 0) return errno;
        if (static_cast<size_t>(len) < buf.size()) {
            target.assign(&buf[0], static_cast<size_t>(len));
            return 0;
        }
        if (buf.size() >= 16 * PATH_MAX) return ENAMETOOLONG;
        buf.resize(buf.size() * 2);
    }
}

int PosixFileSystem::current_dir(std::string& out) const {
    std::vector<char> buf(PATH_MAX);
    if (!::getcwd(&buf[0], buf.size())) return errno;
    out = &buf[0];
    return 0;
}

int PosixFileSystem::open_directory(const std::string& path,
                                    std::unique_ptr<DirectoryStream>& out) const {
    DIR* dir = ::opendir(path.c_str());
    if (!dir) return errno;
    out.reset(new PosixDirectoryStream(dir));
    return 0;
}

int PosixFileSystem::open_read_nofollow(const std::string& path, int& fd) const {
    // O_NONBLOCK keeps a FIFO from blocking the open; the caller rejects
    // anything that is not a regular file before reading.
    int opened = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK);
    if (opened < 0) return errno;

    int flags = ::fcntl(opened, F_GETFL);
    if (flags < 0 || ::fcntl(opened, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        int err = errno;
        ::close(opened);
        return err;
    }
    fd = opened;
    return 0;
}

int PosixFileSystem::stat_fd(int fd, FileStat& out) const {
    struct stat st;
    if (::fstat(fd, &st) != 0) return errno;
    fill_stat(st, out);
    return 0;
}

const FileSystem& default_filesystem() {
    static PosixFileSystem fs;
    return fs;
}

// ============================================================================
// ScopedFd
// ============================================================================

ScopedFd::~ScopedFd() {
    reset();
}

void ScopedFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

} // namespace airgap
