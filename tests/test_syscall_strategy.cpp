#include <gtest/gtest.h>
#include "source/syscall_strategy.hpp"
#include "sysrand/error.hpp"
#include "sysrand/random_source.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <vector>
#include <fcntl.h>

using namespace sysrand;
using namespace sysrand::source;

// ============================================================================
// Probe
// ============================================================================

TEST(SyscallProbeTest, UnsupportedErrorsSelectDevice) {
    EXPECT_EQ(classify_probe_error(ENOSYS), ProbeOutcome::Unavailable);
    EXPECT_EQ(classify_probe_error(EPERM), ProbeOutcome::Unavailable);
}

TEST(SyscallProbeTest, TransientErrorsMeanAvailable) {
    EXPECT_EQ(classify_probe_error(EAGAIN), ProbeOutcome::Available);
    EXPECT_EQ(classify_probe_error(EINTR), ProbeOutcome::Available);
}

TEST(SyscallProbeTest, OtherErrorsAreFatal) {
    EXPECT_EQ(classify_probe_error(EFAULT), ProbeOutcome::Failed);
    EXPECT_EQ(classify_probe_error(EIO), ProbeOutcome::Failed);
    EXPECT_EQ(classify_probe_error(EACCES), ProbeOutcome::Failed);
    EXPECT_EQ(classify_probe_error(EINVAL), ProbeOutcome::Failed);
}

TEST(SyscallProbeTest, ProbeDoesNotFailOnThisHost) {
    int err = 0;
    EXPECT_NE(probe_getrandom(&err), ProbeOutcome::Failed);
    EXPECT_EQ(err, 0);
}

// ============================================================================
// Strategy
// ============================================================================

TEST(SyscallStrategyTest, PlatformStrategyIsSyscallWithFallback) {
    auto strategy = make_platform_strategy();
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->kind(), StrategyKind::SyscallWithFallback);
}

TEST(SyscallStrategyTest, HoldsDeviceOnlyWithoutSyscall) {
    SyscallStrategy strategy;

    EXPECT_NE(strategy.syscall_available(), strategy.device().is_open());

    std::vector<byte> buffer(256, 0);
    strategy.fill(buffer.data(), buffer.size());
    EXPECT_FALSE(std::all_of(buffer.begin(), buffer.end(), [](byte b) { return b == 0; }));
}

TEST(SyscallStrategyTest, DeviceFallbackFills) {
    auto strategy = SyscallStrategy::with_device("/dev/urandom");

    EXPECT_FALSE(strategy->syscall_available());
    ASSERT_TRUE(strategy->device().is_open());
    EXPECT_TRUE(::fcntl(strategy->device().fd(), F_GETFD) & FD_CLOEXEC);

    std::vector<byte> buffer(100, 0);
    strategy->fill(buffer.data(), buffer.size());
    EXPECT_FALSE(std::all_of(buffer.begin(), buffer.end(), [](byte b) { return b == 0; }));
}

TEST(SyscallStrategyTest, DeviceFallbackRejectsNonDevice) {
    EXPECT_THROW(SyscallStrategy::with_device("/"), ResourceError);
}

TEST(SyscallStrategyTest, ExhaustedDeviceFails) {
    auto strategy = SyscallStrategy::with_device("/dev/null");
    byte buffer[16] = {};

    EXPECT_THROW(strategy->fill(buffer, sizeof(buffer)), ExhaustionError);
}

// ============================================================================
// Device-backed RandomSource lifecycle
// ============================================================================

TEST(SyscallStrategyTest, DeviceSourceReopensAfterClose) {
    std::atomic<int> opened{0};
    int last_fd = -1;
    RandomSource source([&]() -> std::unique_ptr<Strategy> {
        auto strategy = SyscallStrategy::with_device("/dev/urandom");
        last_fd = strategy->device().fd();
        ++opened;
        return strategy;
    });

    source.next_uint32();
    int first_fd = last_fd;
    EXPECT_EQ(opened.load(), 1);

    source.close();
    EXPECT_FALSE(source.is_initialized());
    // The descriptor was released
    EXPECT_EQ(::fcntl(first_fd, F_GETFD), -1);

    source.close();

    source.next_uint32();
    EXPECT_EQ(opened.load(), 2);
    ASSERT_TRUE(source.kind().has_value());
    EXPECT_EQ(*source.kind(), StrategyKind::SyscallWithFallback);
}
