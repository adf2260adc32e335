#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>

// sysrand version
#define SYSRAND_VERSION_MAJOR 0
#define SYSRAND_VERSION_MINOR 3
#define SYSRAND_VERSION_PATCH 0
#define SYSRAND_VERSION_STRING "0.3.0"

// Platform detection. Each platform family maps to exactly one random
// source strategy, the build files compile only that strategy's source.
#if defined(_WIN32) || defined(_WIN64)
    #ifndef SYSRAND_PLATFORM_WINDOWS
        #define SYSRAND_PLATFORM_WINDOWS
    #endif
#elif defined(__APPLE__) || defined(__OpenBSD__) || defined(__FreeBSD__) || \
      defined(__NetBSD__) || defined(__DragonFly__)
    #ifndef SYSRAND_PLATFORM_BSD
        #define SYSRAND_PLATFORM_BSD
    #endif
#elif defined(__linux__)
    #ifndef SYSRAND_PLATFORM_LINUX
        #define SYSRAND_PLATFORM_LINUX
    #endif
    #define SYSRAND_PLATFORM_POSIX
#elif defined(__unix__) || defined(__unix)
    #define SYSRAND_PLATFORM_POSIX
#else
    #error "sysrand: no secure random source is known for this platform"
#endif

// Utility macros
#define SYSRAND_UNUSED(x) (void)(x)
#define SYSRAND_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define SYSRAND_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define SYSRAND_DISALLOW_COPY_AND_MOVE(TypeName) \
    SYSRAND_DISALLOW_COPY(TypeName); \
    SYSRAND_DISALLOW_MOVE(TypeName)

namespace sysrand {
namespace constants {

// Fallback device for POSIX systems without getrandom(2)
constexpr const char* RANDOM_DEVICE_PATH = "/dev/urandom";

// Module and export providing RtlGenRandom on Windows
constexpr const char* RTLGENRANDOM_MODULE = "advapi32.dll";
constexpr const char* RTLGENRANDOM_SYMBOL = "SystemFunction036";

} // namespace constants

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

// Base64 (standard alphabet, '=' padding)
std::string base64_encode(const bytes& data);
std::string base64_encode(const void* data, size_t len);
bytes base64_decode(const std::string& encoded);

// Length of the padded base64 encoding of len bytes: 4 * ceil(len / 3)
constexpr size_t base64_encoded_length(size_t len) {
    return ((len + 2) / 3) * 4;
}

} // namespace sysrand
