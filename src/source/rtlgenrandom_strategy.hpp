#pragma once

#include "source/strategy.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace sysrand::source {

/**
 * RtlGenRandom (advapi32.dll!SystemFunction036), for Windows.
 *
 * The module is loaded and the export resolved on construction; the module
 * stays loaded until the strategy is destroyed.
 */
class RtlGenRandomStrategy : public Strategy {
public:
    // @throws ResourceError LibraryLoadFailed or SymbolNotFound
    RtlGenRandomStrategy();
    ~RtlGenRandomStrategy() override;

    SYSRAND_DISALLOW_COPY_AND_MOVE(RtlGenRandomStrategy);

    StrategyKind kind() const override { return StrategyKind::OsApi; }

    void fill(byte* dest, size_t len) override;

private:
    using RtlGenRandomFn = BOOLEAN (APIENTRY*)(PVOID buffer, ULONG length);

    HMODULE module_ = nullptr;
    RtlGenRandomFn gen_random_ = nullptr;
};

} // namespace sysrand::source
