#pragma once

#include "source/strategy.hpp"

namespace sysrand::source {

/**
 * arc4random_buf(3), for the BSDs and macOS. Holds no resource.
 */
class Arc4randomStrategy : public Strategy {
public:
    StrategyKind kind() const override { return StrategyKind::DirectSyscall; }

    void fill(byte* dest, size_t len) override;
};

} // namespace sysrand::source
