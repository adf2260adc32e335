#include "source/rtlgenrandom_strategy.hpp"
#include "sysrand/error.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <limits>

namespace sysrand::source {

RtlGenRandomStrategy::RtlGenRandomStrategy() {
    module_ = ::LoadLibraryA(constants::RTLGENRANDOM_MODULE);
    if (module_ == nullptr) {
        const int err = static_cast<int>(::GetLastError());
        SYSRAND_LOG_ERROR("LoadLibrary({}) failed: {}", constants::RTLGENRANDOM_MODULE, describe_os_error(err));
        throw ResourceError(ErrorCode::LibraryLoadFailed,
            std::string("cannot load ") + constants::RTLGENRANDOM_MODULE, err);
    }

    gen_random_ = reinterpret_cast<RtlGenRandomFn>(
        ::GetProcAddress(module_, constants::RTLGENRANDOM_SYMBOL));
    if (gen_random_ == nullptr) {
        const int err = static_cast<int>(::GetLastError());
        ::FreeLibrary(module_);
        module_ = nullptr;
        SYSRAND_LOG_ERROR("{} not found in {}: {}", constants::RTLGENRANDOM_SYMBOL,
            constants::RTLGENRANDOM_MODULE, describe_os_error(err));
        throw ResourceError(ErrorCode::SymbolNotFound,
            std::string(constants::RTLGENRANDOM_SYMBOL) + " not found", err);
    }

    SYSRAND_LOG_DEBUG("Using RtlGenRandom from {}", constants::RTLGENRANDOM_MODULE);
}

RtlGenRandomStrategy::~RtlGenRandomStrategy() {
    if (module_ != nullptr) {
        ::FreeLibrary(module_);
        SYSRAND_LOG_DEBUG("Unloaded {}", constants::RTLGENRANDOM_MODULE);
    }
}

void RtlGenRandomStrategy::fill(byte* dest, size_t len) {
    // Each call either fills the whole chunk or fails; chunks only exist
    // because the length parameter is a ULONG.
    size_t offset = 0;
    while (offset < len) {
        const ULONG chunk = static_cast<ULONG>(
            std::min<size_t>(len - offset, (std::numeric_limits<ULONG>::max)()));
        if (!gen_random_(dest + offset, chunk)) {
            const int err = static_cast<int>(::GetLastError());
            SYSRAND_LOG_ERROR("RtlGenRandom failed: {}", describe_os_error(err));
            throw ResourceError(ErrorCode::ReadFailed, "RtlGenRandom failed", err);
        }
        offset += chunk;
    }
}

std::unique_ptr<Strategy> make_platform_strategy() {
    return std::make_unique<RtlGenRandomStrategy>();
}

} // namespace sysrand::source
