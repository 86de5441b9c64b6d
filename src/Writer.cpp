/**
 * @file Writer.cpp
 * @brief POSIX implementation of the durable write protocol
 */

#include "yedit/Writer.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Loader.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Util.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace yedit {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

/**
 * @brief Owns a file descriptor, closing it on scope exit
 */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    // Close explicitly so that errors are reported.
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

/**
 * @brief Removes the temporary file unless the write committed
 */
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_) {
            ::unlink(path_.c_str());
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void commit() { committed_ = true; }

private:
    std::string path_;
    bool committed_ = false;
};

void write_all(int fd, const std::string& tmp, const std::string& contents) {
    const char* data = contents.data();
    std::size_t left = contents.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError(tmp, "write", last_error());
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
}

void sync_directory(const std::string& path) {
    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";

    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        YEDIT_LOG_DEBUG("Could not open directory '%s' for fsync: %s",
                        dir.c_str(), last_error().message().c_str());
        return;
    }
    if (::fsync(dfd) != 0) {
        YEDIT_LOG_DEBUG("Directory fsync of '%s' failed: %s",
                        dir.c_str(), last_error().message().c_str());
    }
    ::close(dfd);
}

} // anonymous namespace

std::string temp_path_for(const std::string& path) {
    return path + TEMP_SUFFIX;
}

std::string backup_file(const std::string& path, const std::string& ext) {
    const std::string target = path + ext;
    std::error_code ec;
    fs::copy_file(path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IoError(path, "backup", ec);
    }
    YEDIT_LOG_INFO("Backed up '%s' to '%s'", path.c_str(), target.c_str());
    return target;
}

void write_file_durable(const std::string& path, const std::string& contents,
                        const WriteOptions& opts) {
    if (opts.backup && file_exists(path)) {
        backup_file(path, opts.backup_ext.empty() ? process_start_suffix() : opts.backup_ext);
    }

    struct stat st;
    const bool existing = ::stat(path.c_str(), &st) == 0;
    const mode_t mode = existing ? (st.st_mode & 07777) : 0666;

    const std::string tmp = temp_path_for(path);
    FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, mode));
    if (fd.get() < 0) {
        throw IoError(tmp, "open", last_error());
    }

    // Someone else holds the temporary file: leave it alone.
    if (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
        throw IoError(tmp, "lock", last_error());
    }

    TempFileGuard guard(tmp);

    if (::ftruncate(fd.get(), 0) != 0) {
        throw IoError(tmp, "truncate", last_error());
    }
    if (existing && ::fchmod(fd.get(), mode) != 0) {
        throw IoError(tmp, "chmod", last_error());
    }

    write_all(fd.get(), tmp, contents);

    if (::fsync(fd.get()) != 0) {
        throw IoError(tmp, "fsync", last_error());
    }
    // Between this unlock and the rename another writer can lock and truncate the temp file.
    if (::flock(fd.get(), LOCK_UN) != 0) {
        throw IoError(tmp, "unlock", last_error());
    }
    if (fd.close() != 0) {
        throw IoError(tmp, "close", last_error());
    }

    if (opts.before_rename) {
        opts.before_rename(tmp);
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        throw IoError(path, "rename", last_error());
    }
    guard.commit();

    sync_directory(path);
    YEDIT_LOG_INFO("Wrote %zu bytes to '%s'", contents.size(), path.c_str());
}

} // namespace yedit
