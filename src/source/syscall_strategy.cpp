#include "source/syscall_strategy.hpp"
#include "source/retrying_reader.hpp"
#include "sysrand/error.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <sys/syscall.h>
#include <unistd.h>

// Older libc headers lack <sys/random.h>; the flag value is part of the
// kernel ABI.
#ifndef GRND_NONBLOCK
#define GRND_NONBLOCK 0x0001
#endif

namespace sysrand::source {

namespace {

#if defined(SYS_getrandom)
// Called through syscall(2): libc wrappers for getrandom arrived years
// after the kernel interface.
ssize_t sys_getrandom(void* dest, size_t len, unsigned int flags) {
    return static_cast<ssize_t>(::syscall(SYS_getrandom, dest, len, flags));
}
#endif

} // namespace

ProbeOutcome classify_probe_error(int err) {
    switch (err) {
        case ENOSYS:
        case EPERM:
            return ProbeOutcome::Unavailable;
        case EINTR:
        case EAGAIN:
            // The call exists; the pool is not initialized yet or a signal
            // arrived. Blocking reads will wait for it.
            return ProbeOutcome::Available;
        default:
            return ProbeOutcome::Failed;
    }
}

ProbeOutcome probe_getrandom(int* err) {
#if defined(SYS_getrandom)
    byte scratch = 0;
    if (sys_getrandom(&scratch, 1, GRND_NONBLOCK) >= 0) {
        return ProbeOutcome::Available;
    }
    const int probe_err = errno;
    const ProbeOutcome outcome = classify_probe_error(probe_err);
    if (outcome == ProbeOutcome::Failed && err != nullptr) {
        *err = probe_err;
    }
    return outcome;
#else
    SYSRAND_UNUSED(err);
    return ProbeOutcome::Unavailable;
#endif
}

SyscallStrategy::SyscallStrategy(const std::string& device_path) {
    int err = 0;
    switch (probe_getrandom(&err)) {
        case ProbeOutcome::Available:
            syscall_available_ = true;
            SYSRAND_LOG_DEBUG("Using getrandom(2)");
            break;
        case ProbeOutcome::Unavailable:
            SYSRAND_LOG_WARN("getrandom(2) is not supported, falling back to {}", device_path);
            device_ = DeviceFile::open(device_path);
            break;
        case ProbeOutcome::Failed:
            SYSRAND_LOG_ERROR("getrandom(2) probe failed: {}", describe_os_error(err));
            throw ResourceError(ErrorCode::SyscallProbeFailed, "getrandom probe failed", err);
    }
}

SyscallStrategy::SyscallStrategy(DeviceFile device)
    : syscall_available_(false), device_(std::move(device)) {}

std::unique_ptr<SyscallStrategy> SyscallStrategy::with_device(const std::string& device_path) {
    SYSRAND_LOG_DEBUG("Reading random data from {} only", device_path);
    return std::unique_ptr<SyscallStrategy>(new SyscallStrategy(DeviceFile::open(device_path)));
}

void SyscallStrategy::fill(byte* dest, size_t len) {
#if defined(SYS_getrandom)
    if (syscall_available_) {
        read_fully([](byte* d, size_t n) { return sys_getrandom(d, n, 0); },
                   dest, len, "getrandom");
        return;
    }
#endif
    device_.read(dest, len);
}

std::unique_ptr<Strategy> make_platform_strategy() {
    return std::make_unique<SyscallStrategy>();
}

} // namespace sysrand::source
