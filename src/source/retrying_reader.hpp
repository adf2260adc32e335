#pragma once

#include "sysrand/common.hpp"
#include "sysrand/error.hpp"
#include "utils/logger.hpp"
#include <cerrno>

namespace sysrand::source {

// EINTR and EAGAIN never escape read_fully
inline bool is_transient_error(int err) {
    return err == EINTR || err == EAGAIN || err == EWOULDBLOCK;
}

/**
 * Fill dest[0, len) by calling read_op until every byte is written.
 *
 * read_op(byte* dest, size_t len) follows read(2): it returns the number of
 * bytes written, 0 at end of data, or -1 with errno set. Short reads resume
 * at the first unwritten byte; interrupted and would-block calls are retried
 * on the same range.
 *
 * Throws ExhaustionError when read_op reports end of data early, and
 * ResourceError (ReadFailed) for any other failure. The buffer contents are
 * unspecified after a throw.
 */
template<typename ReadOp>
void read_fully(ReadOp&& read_op, byte* dest, size_t len, const char* source_name) {
    size_t offset = 0;

    while (offset < len) {
        const size_t remaining = len - offset;
        errno = 0;
        const auto result = read_op(dest + offset, remaining);

        if (result < 0) {
            const int err = errno;
            if (is_transient_error(err)) {
                continue;
            }
            SYSRAND_LOG_ERROR("Reading {} failed after {} of {} bytes: {}",
                source_name, offset, len, describe_os_error(err));
            throw ResourceError(ErrorCode::ReadFailed,
                std::string("read from ") + source_name + " failed", err);
        }

        if (result == 0) {
            SYSRAND_LOG_ERROR("{} returned end of data after {} of {} bytes",
                source_name, offset, len);
            throw ExhaustionError(std::string(source_name) + " returned no more data", len, offset);
        }

        const size_t count = static_cast<size_t>(result);
        if (count > remaining) {
            SYSRAND_LOG_ERROR("{} reported {} bytes for a {} byte read", source_name, count, remaining);
            throw ResourceError(ErrorCode::ReadFailed,
                std::string(source_name) + " reported more bytes than requested");
        }
        offset += count;
    }
}

} // namespace sysrand::source
