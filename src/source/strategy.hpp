#pragma once

#include "sysrand/common.hpp"
#include "sysrand/random_source.hpp"
#include <memory>

namespace sysrand::source {

/**
 * One way of reaching the OS random source.
 *
 * A strategy owns whatever resource it needs for its whole lifetime and
 * releases it in its destructor. Constructing one either fully succeeds or
 * throws ResourceError. fill() must be safe to call concurrently.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual StrategyKind kind() const = 0;

    // Fill dest[0, len) completely or throw
    virtual void fill(byte* dest, size_t len) = 0;
};

// Defined by the strategy source compiled for the target platform
std::unique_ptr<Strategy> make_platform_strategy();

} // namespace sysrand::source
