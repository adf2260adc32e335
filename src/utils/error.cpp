#include "sysrand/error.hpp"
#include <sstream>
#include <system_error>

namespace sysrand {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";

        case ErrorCode::DeviceOpenFailed: return "Random device open failed";
        case ErrorCode::DeviceNotCharacter: return "Random device is not a character device";
        case ErrorCode::LibraryLoadFailed: return "System library load failed";
        case ErrorCode::SymbolNotFound: return "System symbol not found";
        case ErrorCode::SyscallProbeFailed: return "Random syscall probe failed";
        case ErrorCode::ReadFailed: return "Random source read failed";

        case ErrorCode::SourceExhausted: return "Random source exhausted";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (os_error_ != 0) {
        oss << " (" << describe_os_error(os_error_) << ")";
    }
    return oss.str();
}

std::string describe_os_error(int os_error) {
    std::ostringstream oss;
    oss << std::system_category().message(os_error) << " (error " << os_error << ")";
    return oss.str();
}

} // namespace sysrand
