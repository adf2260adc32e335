#pragma once

#include "sysrand/common.hpp"
#include "sysrand/error.hpp"
#include "sysrand/random_source.hpp"
#include <string>

namespace sysrand {

/**
 * Process-wide random source used by the functions below. Created on first
 * use; its strategy is selected on the first request for random data.
 */
RandomSource& default_source();

/**
 * Fill a buffer with random bytes from the OS
 * @param dest Buffer to fill
 * @param len Buffer size, 0 is a no-op
 * @throws ResourceError, ExhaustionError; the buffer is wiped on error
 */
void fill_random_bytes(byte* dest, size_t len);
void fill_random_bytes(bytes& buffer);

/**
 * Random value in [0, 0xffffffff], native byte order
 */
uint32_t random_uint32();

/**
 * Random value in [0, 2^64)
 */
uint64_t random_uint64();

/**
 * Uniform random integer in [0, upper_bound), without modulo bias
 * @throws SysrandException InvalidArgument when upper_bound is 0
 */
uint32_t random_uniform(uint32_t upper_bound);

/**
 * Fixed-size array of random bytes
 */
template<size_t N>
fixed_bytes<N> random_bytes() {
    fixed_bytes<N> result{};
    fill_random_bytes(result.data(), result.size());
    return result;
}

bytes random_bytes(size_t len);

/**
 * Base64 of byte_length random bytes: 4 * ceil(byte_length / 3) characters,
 * standard alphabet with '=' padding
 */
std::string random_string(size_t byte_length);

template<size_t N>
std::string random_string() {
    return random_string(N);
}

/**
 * Release the OS resource held by the default source, if any. Always
 * succeeds and may be called repeatedly; the next request re-initializes.
 * Must not race with other threads using the default source.
 */
void close_random();

// Non-throwing variants
Result<void> try_fill_random_bytes(byte* dest, size_t len);
Result<uint32_t> try_random_uint32();

} // namespace sysrand
