#pragma once

#include "source/device_file.hpp"
#include "source/strategy.hpp"
#include <memory>
#include <string>

namespace sysrand::source {

// How a one byte non-blocking getrandom(2) trial call ended
enum class ProbeOutcome {
    Available,    // the syscall works (possibly not seeded yet)
    Unavailable,  // ENOSYS or EPERM: use the random device
    Failed        // anything else: fatal
};

// Map the errno of a failed trial call to its outcome
ProbeOutcome classify_probe_error(int err);

// Run the trial call. Unavailable when the platform headers know no
// getrandom syscall at all. Failed outcomes carry the errno in *err.
ProbeOutcome probe_getrandom(int* err);

/**
 * getrandom(2) with a /dev/urandom fallback, for Linux and other POSIX
 * systems.
 *
 * The constructor probes the syscall once; if it is unsupported the random
 * device is opened and kept open until the strategy is destroyed. Which of
 * the two primitives is used never changes afterwards.
 */
class SyscallStrategy : public Strategy {
public:
    /**
     * @param device_path Device to fall back to when getrandom is unsupported
     * @throws ResourceError when the probe fails or the device cannot be used
     */
    explicit SyscallStrategy(const std::string& device_path = constants::RANDOM_DEVICE_PATH);

    // Skip the probe and read only from the device at device_path
    static std::unique_ptr<SyscallStrategy> with_device(const std::string& device_path);

    StrategyKind kind() const override { return StrategyKind::SyscallWithFallback; }

    void fill(byte* dest, size_t len) override;

    // True when getrandom is used and no device is held
    bool syscall_available() const { return syscall_available_; }

    const DeviceFile& device() const { return device_; }

private:
    explicit SyscallStrategy(DeviceFile device);

    bool syscall_available_ = false;
    DeviceFile device_;
};

} // namespace sysrand::source
