#include <gtest/gtest.h>
#include "source/strategy.hpp"
#include "sysrand/error.hpp"
#include "sysrand/random_source.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>

using namespace sysrand;
using namespace sysrand::source;

namespace {

struct Counters {
    std::atomic<int> created{0};
    std::atomic<int> released{0};
    std::atomic<int> fills{0};
};

// Writes 1, 2, 3, ... into every request
class CountingStrategy : public Strategy {
public:
    explicit CountingStrategy(std::shared_ptr<Counters> counters)
        : counters_(std::move(counters)) {
        ++counters_->created;
    }

    ~CountingStrategy() override {
        ++counters_->released;
    }

    StrategyKind kind() const override { return StrategyKind::OsApi; }

    void fill(byte* dest, size_t len) override {
        ++counters_->fills;
        for (size_t i = 0; i < len; ++i) {
            dest[i] = static_cast<byte>(i + 1);
        }
    }

private:
    std::shared_ptr<Counters> counters_;
};

// Writes half the request, then reports the source ran dry
class DryStrategy : public Strategy {
public:
    StrategyKind kind() const override { return StrategyKind::SyscallWithFallback; }

    void fill(byte* dest, size_t len) override {
        std::memset(dest, 0xAA, len / 2);
        throw ExhaustionError("dry source", len, len / 2);
    }
};

} // namespace

class RandomSourceTest : public ::testing::Test {
protected:
    std::shared_ptr<Counters> counters = std::make_shared<Counters>();

    RandomSource::StrategyFactory counting_factory() {
        auto c = counters;
        return [c]() { return std::make_unique<CountingStrategy>(c); };
    }
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(RandomSourceTest, InitializesLazilyOnce) {
    RandomSource source(counting_factory());
    EXPECT_FALSE(source.is_initialized());
    EXPECT_FALSE(source.kind().has_value());
    EXPECT_EQ(counters->created.load(), 0);

    std::vector<byte> buffer(8);
    source.fill(buffer);
    source.fill(buffer);

    ASSERT_TRUE(source.kind().has_value());
    EXPECT_EQ(*source.kind(), StrategyKind::OsApi);
    EXPECT_EQ(counters->created.load(), 1);
    EXPECT_EQ(counters->fills.load(), 2);
}

TEST_F(RandomSourceTest, ZeroLengthRequestTouchesNothing) {
    RandomSource source(counting_factory());
    byte sentinel = 0x5A;

    source.fill(&sentinel, 0);

    EXPECT_EQ(sentinel, 0x5A);
    EXPECT_FALSE(source.is_initialized());
    EXPECT_EQ(counters->fills.load(), 0);
}

TEST_F(RandomSourceTest, ConcurrentFirstUseInitializesOnce) {
    auto c = counters;
    RandomSource source([c]() {
        // Widen the window in which several threads race to initialize
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::make_unique<CountingStrategy>(c);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&source]() {
            for (int j = 0; j < 10; ++j) {
                source.next_uint32();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(counters->created.load(), 1);
    EXPECT_EQ(counters->fills.load(), 80);
}

TEST_F(RandomSourceTest, FailedInitializationIsNotPublished) {
    auto c = counters;
    int attempts = 0;
    RandomSource source([c, &attempts]() -> std::unique_ptr<Strategy> {
        if (attempts++ == 0) {
            throw ResourceError(ErrorCode::DeviceOpenFailed, "simulated open failure", ENOENT);
        }
        return std::make_unique<CountingStrategy>(c);
    });

    byte buffer[4] = {};
    EXPECT_THROW(source.fill(buffer, sizeof(buffer)), ResourceError);
    EXPECT_FALSE(source.is_initialized());

    EXPECT_NO_THROW(source.fill(buffer, sizeof(buffer)));
    EXPECT_TRUE(source.is_initialized());
    EXPECT_EQ(attempts, 2);
}

TEST_F(RandomSourceTest, NullStrategyIsAnError) {
    RandomSource source([]() { return std::unique_ptr<Strategy>(); });
    byte buffer[4] = {};

    EXPECT_THROW(source.fill(buffer, sizeof(buffer)), ResourceError);
    EXPECT_FALSE(source.is_initialized());
}

// ============================================================================
// Filling
// ============================================================================

TEST_F(RandomSourceTest, Uint32UsesFourBytesInNativeOrder) {
    RandomSource source(counting_factory());

    uint32_t value = source.next_uint32();

    const byte expected_bytes[4] = {1, 2, 3, 4};
    uint32_t expected;
    std::memcpy(&expected, expected_bytes, sizeof(expected));
    EXPECT_EQ(value, expected);
}

TEST_F(RandomSourceTest, FailedFillWipesBuffer) {
    RandomSource source([]() { return std::make_unique<DryStrategy>(); });
    std::vector<byte> buffer(32, 0x55);

    EXPECT_THROW(source.fill(buffer), ExhaustionError);
    EXPECT_TRUE(std::all_of(buffer.begin(), buffer.end(), [](byte b) { return b == 0; }));
    // A failing read does not tear down the source
    EXPECT_TRUE(source.is_initialized());
}

// ============================================================================
// Closing
// ============================================================================

TEST_F(RandomSourceTest, CloseIsIdempotent) {
    RandomSource source(counting_factory());
    byte buffer[4];
    source.fill(buffer, sizeof(buffer));

    EXPECT_NO_THROW(source.close());
    EXPECT_NO_THROW(source.close());

    EXPECT_FALSE(source.is_initialized());
    EXPECT_EQ(counters->released.load(), 1);
}

TEST_F(RandomSourceTest, CloseBeforeUseIsNoop) {
    RandomSource source(counting_factory());

    EXPECT_NO_THROW(source.close());
    EXPECT_EQ(counters->created.load(), 0);
    EXPECT_EQ(counters->released.load(), 0);
}

TEST_F(RandomSourceTest, ReinitializesAfterClose) {
    RandomSource source(counting_factory());
    byte buffer[4];

    source.fill(buffer, sizeof(buffer));
    source.close();
    source.fill(buffer, sizeof(buffer));

    EXPECT_TRUE(source.is_initialized());
    EXPECT_EQ(counters->created.load(), 2);
    EXPECT_EQ(counters->released.load(), 1);
}

TEST_F(RandomSourceTest, DestructionReleasesStrategy) {
    {
        RandomSource source(counting_factory());
        source.next_uint32();
    }
    EXPECT_EQ(counters->released.load(), 1);
}

// ============================================================================
// Platform strategy
// ============================================================================

TEST(PlatformRandomSourceTest, UsesCompiledStrategy) {
    RandomSource source;
    std::vector<byte> buffer(64, 0);

    source.fill(buffer);

    EXPECT_FALSE(std::all_of(buffer.begin(), buffer.end(), [](byte b) { return b == 0; }));
    ASSERT_TRUE(source.kind().has_value());
#if defined(SYSRAND_PLATFORM_WINDOWS)
    EXPECT_EQ(*source.kind(), StrategyKind::OsApi);
#elif defined(SYSRAND_PLATFORM_BSD)
    EXPECT_EQ(*source.kind(), StrategyKind::DirectSyscall);
#else
    EXPECT_EQ(*source.kind(), StrategyKind::SyscallWithFallback);
#endif

    source.close();
    EXPECT_FALSE(source.is_initialized());
}

TEST(PlatformRandomSourceTest, StrategyKindNames) {
    EXPECT_STREQ(strategy_kind_to_string(StrategyKind::DirectSyscall), "direct syscall");
    EXPECT_STREQ(strategy_kind_to_string(StrategyKind::OsApi), "OS API");
    EXPECT_STREQ(strategy_kind_to_string(StrategyKind::SyscallWithFallback), "syscall with device fallback");
}
