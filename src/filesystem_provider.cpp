#include "filesystem_provider.hpp"
#include "debug.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace MediaOrganizer {

namespace {

std::error_code lastErrno() {
    return std::error_code(errno, std::generic_category());
}

// Closes a POSIX descriptor on scope exit
struct FdGuard {
    int fd = -1;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

} // namespace

bool LocalFilesystem::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    bool found = std::filesystem::exists(path, ec);
    return found && !ec;
}

std::optional<uint64_t> LocalFilesystem::fileSize(const std::filesystem::path& path) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

bool LocalFilesystem::sameVolume(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const {
    struct stat srcStat{};
    struct stat dstStat{};
    auto destDir = destination.has_parent_path() ? destination.parent_path() : std::filesystem::path(".");

    if (::stat(source.c_str(), &srcStat) != 0) return false;
    if (::stat(destDir.c_str(), &dstStat) != 0) return false;
    return srcStat.st_dev == dstStat.st_dev;
}

std::optional<OperationError> LocalFilesystem::rename(const std::filesystem::path& source,
                                                      const std::filesystem::path& destination) {
#ifdef RENAME_NOREPLACE
    if (::renameat2(AT_FDCWD, source.c_str(), AT_FDCWD, destination.c_str(), RENAME_NOREPLACE) == 0) {
        return std::nullopt;
    }
    // CIFS and some FUSE shares reject the flag; fall through to a checked rename
    if (errno != EINVAL && errno != ENOSYS && errno != ENOTSUP) {
        return makeFsError(lastErrno(), "rename " + source.string() + " -> " + destination.string());
    }
#endif
    if (exists(destination)) {
        return OperationError{ErrorKind::Collision, "destination exists: " + destination.string()};
    }

    std::error_code ec;
    std::filesystem::rename(source, destination, ec);
    if (ec) {
        return makeFsError(ec, "rename " + source.string() + " -> " + destination.string());
    }
    return std::nullopt;
}

ChunkResult LocalFilesystem::copyChunk(const std::filesystem::path& source, uint64_t sourceOffset,
                                       const std::filesystem::path& destination,
                                       std::vector<char>& buffer) {
    ChunkResult result;

    FdGuard in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) {
        result.error = makeFsError(lastErrno(), "open " + source.string());
        return result;
    }

    int flags = O_WRONLY | O_CLOEXEC | O_CREAT;
    if (sourceOffset == 0) flags |= O_TRUNC;
    FdGuard out(::open(destination.c_str(), flags, 0644));
    if (out.fd < 0) {
        result.error = makeFsError(lastErrno(), "open " + destination.string());
        return result;
    }

    ssize_t readBytes = ::pread(in.fd, buffer.data(), buffer.size(), static_cast<off_t>(sourceOffset));
    if (readBytes < 0) {
        result.error = makeFsError(lastErrno(), "read " + source.string());
        return result;
    }

    size_t written = 0;
    while (written < static_cast<size_t>(readBytes)) {
        ssize_t n = ::pwrite(out.fd, buffer.data() + written, static_cast<size_t>(readBytes) - written,
                             static_cast<off_t>(sourceOffset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = makeFsError(lastErrno(), "write " + destination.string());
            result.bytesWritten = written;
            return result;
        }
        written += static_cast<size_t>(n);
    }

    result.bytesWritten = written;
    return result;
}

std::optional<OperationError> LocalFilesystem::remove(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
        if (ec) {
            return makeFsError(ec, "remove " + path.string());
        }
        return OperationError{ErrorKind::NotFound, "remove " + path.string() + ": no such file"};
    }
    return std::nullopt;
}

std::optional<OperationError> LocalFilesystem::createDirectories(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return makeFsError(ec, "create " + directory.string());
    }
    return std::nullopt;
}

} // namespace MediaOrganizer
