#pragma once

#include "sysrand/common.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace sysrand {

/**
 * How the OS random source is reached on this platform
 */
enum class StrategyKind {
    DirectSyscall,       // handle-free call, e.g. arc4random_buf
    OsApi,               // dynamically resolved system library export
    SyscallWithFallback  // getrandom(2), or the random device when unsupported
};

const char* strategy_kind_to_string(StrategyKind kind);

namespace source {
class Strategy;
}

/**
 * Handle on the operating system's secure random source.
 *
 * The platform strategy is selected and its resource (device descriptor,
 * library handle) acquired on the first request, exactly once even under
 * concurrent first use. Afterwards fill() runs without locking.
 *
 * close() releases the resource and returns the source to the
 * uninitialized state; the next request selects a strategy again.
 * Calling close() while another thread is inside fill() is a caller error.
 */
class RandomSource {
public:
    using StrategyFactory = std::function<std::unique_ptr<source::Strategy>()>;

    // Uses the strategy compiled in for the target platform
    RandomSource();
    explicit RandomSource(StrategyFactory factory);
    ~RandomSource();

    SYSRAND_DISALLOW_COPY_AND_MOVE(RandomSource);

    /**
     * Fill dest[0, len) with random bytes.
     * On error the buffer is wiped and ResourceError or ExhaustionError
     * propagates; no random data was produced.
     */
    void fill(byte* dest, size_t len);
    void fill(bytes& buffer);

    uint32_t next_uint32();

    // Idempotent
    void close();

    bool is_initialized() const;

    // Kind of the active strategy, nullopt while uninitialized
    std::optional<StrategyKind> kind() const;

private:
    source::Strategy& acquire();

    StrategyFactory factory_;
    mutable std::mutex mutex_;
    std::unique_ptr<source::Strategy> strategy_;
};

} // namespace sysrand
