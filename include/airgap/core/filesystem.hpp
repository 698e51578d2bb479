/*
 * AirGap C++ - Filesystem access seam
 *
 * Every metadata call the sandbox issues (lstat, stat, readlink, directory
 * streaming, open) goes through a FileSystem. Production code uses
 * PosixFileSystem; tests substitute an instrumented double to verify which
 * paths were touched.
 *
 * All methods return 0 on success or an errno value on failure.
 */
#ifndef airgap_CORE_FILESYSTEM_HPP
#define airgap_CORE_FILESYSTEM_HPP

#include <string>
#include <memory>
#include <cstdint>

namespace airgap {

enum class FileKind {
    REGULAR,
    DIRECTORY,
    SYMLINK,
    OTHER       // fifo, socket, device
};

struct FileStat {
    FileKind kind;
    int64_t size;

    FileStat() : kind(FileKind::OTHER), size(0) {}
};

// One directory entry as reported by readdir. The kind is only a hint from
// d_type and is not known on every filesystem.
struct DirEntryInfo {
    std::string name;
    FileKind kind;
    bool kind_known;

    DirEntryInfo() : kind(FileKind::OTHER), kind_known(false) {}
};

// Streaming directory reader; never materializes the listing
class DirectoryStream {
public:
    virtual ~DirectoryStream() {}

    // Next entry, skipping "." and "..". Returns false at end of stream or
    // on error; error() distinguishes the two.
    virtual bool next(DirEntryInfo& out) = 0;
    virtual int error() const = 0;
};

class FileSystem {
public:
    virtual ~FileSystem() {}

    virtual int lstat(const std::string& path, FileStat& out) const = 0;
    virtual int stat(const std::string& path, FileStat& out) const = 0;
    virtual int read_link(const std::string& path, std::string& target) const = 0;
    virtual int current_dir(std::string& out) const = 0;

    virtual int open_directory(const std::string& path,
                               std::unique_ptr<DirectoryStream>& out) const = 0;

    // Open a regular file read-only without following a final symlink
    // component. On success `fd` owns a new descriptor.
    virtual int open_read_nofollow(const std::string& path, int& fd) const = 0;

    // fstat on an open descriptor
    virtual int stat_fd(int fd, FileStat& out) const = 0;
};

class PosixFileSystem : public FileSystem {
public:
    int lstat(const std::string& path, FileStat& out) const override;
    int stat(const std::string& path, FileStat& out) const override;
    int read_link(const std::string& path, std::string& target) const override;
    int current_dir(std::string& out) const override;
    int open_directory(const std::string& path,
                       std::unique_ptr<DirectoryStream>& out) const override;
    int open_read_nofollow(const std::string& path, int& fd) const override;
    int stat_fd(int fd, FileStat& out) const override;
};

// Process-wide POSIX filesystem
const FileSystem& default_filesystem();

// Owns a file descriptor and closes it on scope exit
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd();

    int get() const { return fd_; }
    void reset(int fd = -1);

private:
    ScopedFd(const ScopedFd&);
    ScopedFd& operator=(const ScopedFd&);

    int fd_;
};

} // namespace airgap

#endif // airgap_CORE_FILESYSTEM_HPP
