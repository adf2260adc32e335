#pragma once

#include "sysrand/common.hpp"
#include <string>
#include <sys/types.h>

namespace sysrand::source {

/**
 * Read-only descriptor on a random character device (/dev/urandom).
 *
 * open() only hands out descriptors that refer to a character device and
 * carry FD_CLOEXEC. The descriptor is closed on destruction.
 */
class DeviceFile {
public:
    /**
     * Open and validate a random device
     * @throws ResourceError DeviceOpenFailed when open/fstat/fcntl fail,
     *         DeviceNotCharacter when path is not a character device
     */
    static DeviceFile open(const std::string& path = constants::RANDOM_DEVICE_PATH);

    DeviceFile() = default;
    ~DeviceFile();

    DeviceFile(DeviceFile&& other) noexcept;
    DeviceFile& operator=(DeviceFile&& other) noexcept;
    SYSRAND_DISALLOW_COPY(DeviceFile);

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

    // One read(2) call
    ssize_t read_some(byte* dest, size_t len) const;

    // Fill dest[0, len) through read_fully
    void read(byte* dest, size_t len) const;

    // Idempotent
    void close();

private:
    DeviceFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::string path_;
};

} // namespace sysrand::source
