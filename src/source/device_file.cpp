#include "source/device_file.hpp"
#include "source/retrying_reader.hpp"
#include "sysrand/error.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sysrand::source {

namespace {

[[noreturn]] void fail_open(int fd, const std::string& path, const char* what, int err) {
    if (fd >= 0) {
        ::close(fd);
    }
    SYSRAND_LOG_ERROR("{} {} failed: {}", what, path, describe_os_error(err));
    throw ResourceError(ErrorCode::DeviceOpenFailed, std::string(what) + " " + path + " failed", err);
}

} // namespace

DeviceFile DeviceFile::open(const std::string& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        fail_open(fd, path, "open", errno);
    }

    // The device node could have been replaced by a regular file or a
    // link to one; only a character device is a random source.
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        fail_open(fd, path, "fstat", errno);
    }
    if (!S_ISCHR(st.st_mode)) {
        ::close(fd);
        SYSRAND_LOG_ERROR("{} is not a character device, refusing to read from it", path);
        throw ResourceError(ErrorCode::DeviceNotCharacter, path + " is not a character device");
    }

    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) {
        fail_open(fd, path, "fcntl(F_GETFD) on", errno);
    }
    if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
        fail_open(fd, path, "fcntl(F_SETFD) on", errno);
    }

    SYSRAND_LOG_DEBUG("Opened random device {} (fd {})", path, fd);
    return DeviceFile(fd, path);
}

DeviceFile::~DeviceFile() {
    close();
}

DeviceFile::DeviceFile(DeviceFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

DeviceFile& DeviceFile::operator=(DeviceFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

ssize_t DeviceFile::read_some(byte* dest, size_t len) const {
    return ::read(fd_, dest, len);
}

void DeviceFile::read(byte* dest, size_t len) const {
    read_fully([this](byte* d, size_t n) { return read_some(d, n); },
               dest, len, path_.c_str());
}

void DeviceFile::close() {
    if (fd_ < 0) {
        return;
    }
    // The descriptor is released even when close(2) reports an error
    if (::close(fd_) != 0) {
        SYSRAND_LOG_WARN("close({}) on {} reported: {}", fd_, path_, describe_os_error(errno));
    } else {
        SYSRAND_LOG_DEBUG("Closed random device {}", path_);
    }
    fd_ = -1;
}

} // namespace sysrand::source
