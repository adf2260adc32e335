#include "source/arc4random_strategy.hpp"
#include "utils/logger.hpp"
#include <stdlib.h>

namespace sysrand::source {

void Arc4randomStrategy::fill(byte* dest, size_t len) {
    // Cannot fail and always writes len bytes
    arc4random_buf(dest, len);
}

std::unique_ptr<Strategy> make_platform_strategy() {
    SYSRAND_LOG_DEBUG("Using arc4random_buf(3)");
    return std::make_unique<Arc4randomStrategy>();
}

} // namespace sysrand::source
