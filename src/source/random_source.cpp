#include "sysrand/random_source.hpp"
#include "sysrand/error.hpp"
#include "source/strategy.hpp"
#include "utils/logger.hpp"
#include <sodium.h>

namespace sysrand {

const char* strategy_kind_to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::DirectSyscall: return "direct syscall";
        case StrategyKind::OsApi: return "OS API";
        case StrategyKind::SyscallWithFallback: return "syscall with device fallback";
        default: return "unknown";
    }
}

RandomSource::RandomSource()
    : factory_(&source::make_platform_strategy) {}

RandomSource::RandomSource(StrategyFactory factory)
    : factory_(std::move(factory)) {}

RandomSource::~RandomSource() = default;

source::Strategy& RandomSource::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!strategy_) {
        // Published only once the factory returned a complete strategy; a
        // throwing factory leaves the source uninitialized.
        auto strategy = factory_();
        if (!strategy) {
            throw ResourceError(ErrorCode::Unknown, "random source factory returned no strategy");
        }
        SYSRAND_LOG_DEBUG("Random source initialized: {}", strategy_kind_to_string(strategy->kind()));
        strategy_ = std::move(strategy);
    }
    return *strategy_;
}

void RandomSource::fill(byte* dest, size_t len) {
    if (len == 0) {
        return;
    }

    source::Strategy& strategy = acquire();
    try {
        strategy.fill(dest, len);
    } catch (const SysrandException&) {
        // Never leave partial random data behind for a caller to misuse
        sodium_memzero(dest, len);
        throw;
    }
}

void RandomSource::fill(bytes& buffer) {
    fill(buffer.data(), buffer.size());
}

uint32_t RandomSource::next_uint32() {
    uint32_t value = 0;
    fill(reinterpret_cast<byte*>(&value), sizeof(value));
    return value;
}

void RandomSource::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (strategy_) {
        SYSRAND_LOG_DEBUG("Closing random source ({})", strategy_kind_to_string(strategy_->kind()));
        strategy_.reset();
    }
}

bool RandomSource::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategy_ != nullptr;
}

std::optional<StrategyKind> RandomSource::kind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!strategy_) {
        return std::nullopt;
    }
    return strategy_->kind();
}

} // namespace sysrand
