#include "sysrand/random.hpp"
#include <sodium.h>

namespace sysrand {

RandomSource& default_source() {
    static RandomSource source;
    return source;
}

void fill_random_bytes(byte* dest, size_t len) {
    default_source().fill(dest, len);
}

void fill_random_bytes(bytes& buffer) {
    default_source().fill(buffer);
}

uint32_t random_uint32() {
    return default_source().next_uint32();
}

uint64_t random_uint64() {
    uint64_t high = random_uint32();
    uint64_t low = random_uint32();
    return (high << 32) | low;
}

uint32_t random_uniform(uint32_t upper_bound) {
    if (upper_bound == 0) {
        throw SysrandException(ErrorCode::InvalidArgument, "random_uniform: upper bound must be positive");
    }
    if (upper_bound == 1) {
        return 0;
    }

    // Reject values below 2^32 mod upper_bound so the remaining range is a
    // multiple of upper_bound.
    const uint32_t min = (0u - upper_bound) % upper_bound;
    uint32_t value;
    do {
        value = random_uint32();
    } while (value < min);
    return value % upper_bound;
}

bytes random_bytes(size_t len) {
    bytes result(len);
    fill_random_bytes(result);
    return result;
}

std::string random_string(size_t byte_length) {
    bytes raw = random_bytes(byte_length);
    std::string encoded = base64_encode(raw);
    sodium_memzero(raw.data(), raw.size());
    return encoded;
}

void close_random() {
    default_source().close();
}

Result<void> try_fill_random_bytes(byte* dest, size_t len) {
    try {
        fill_random_bytes(dest, len);
    } catch (const SysrandException& e) {
        return Result<void>::Err(e.to_error());
    }
    return Result<void>::Ok();
}

Result<uint32_t> try_random_uint32() {
    try {
        return Result<uint32_t>::Ok(random_uint32());
    } catch (const SysrandException& e) {
        return Result<uint32_t>::Err(e.to_error());
    }
}

} // namespace sysrand
