#include "sysrand/common.hpp"
#include "sysrand/error.hpp"
#include <sodium.h>

namespace sysrand {

std::string base64_encode(const void* data, size_t len) {
    // sodium_bin2base64 writes a terminating NUL after the encoded text
    std::string result(sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(result.data(), result.size(),
                      static_cast<const unsigned char*>(data), len,
                      sodium_base64_VARIANT_ORIGINAL);
    result.resize(base64_encoded_length(len));
    return result;
}

std::string base64_encode(const bytes& data) {
    return base64_encode(data.data(), data.size());
}

bytes base64_decode(const std::string& encoded) {
    bytes result(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;

    if (sodium_base642bin(result.data(), result.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != encoded.data() + encoded.size()) {
        throw SysrandException(ErrorCode::InvalidArgument, "Invalid base64 input");
    }

    result.resize(decoded_len);
    return result;
}

} // namespace sysrand
