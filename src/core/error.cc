// =============================================================================
// Flamingo - Error Handling Implementation
// =============================================================================

#include "flamingo/error.h"

#include "flamingo/common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace flamingo {

// =============================================================================
// Assert Failure
// =============================================================================

[[noreturn]] void assertFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Assertion failed: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Error Code to String
// =============================================================================

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return "OK";

    // Configuration errors
    case ErrorCode::kConfigurationError:
        return "ConfigurationError";
    case ErrorCode::kSettingsParseError:
        return "SettingsParseError";
    case ErrorCode::kSearchSpaceTooLarge:
        return "SearchSpaceTooLarge";

    // I/O errors
    case ErrorCode::kIoError:
        return "IoError";
    case ErrorCode::kMalformedLog:
        return "MalformedLog";

    // Process errors
    case ErrorCode::kProcessLaunchFailed:
        return "ProcessLaunchFailed";
    case ErrorCode::kProcessFailed:
        return "ProcessFailed";

    // Registry errors
    case ErrorCode::kNotFound:
        return "NotFound";
    case ErrorCode::kAlreadyExists:
        return "AlreadyExists";

    // General errors
    case ErrorCode::kInvalidInput:
        return "InvalidInput";
    case ErrorCode::kNotSupported:
        return "NotSupported";

    // Internal errors
    case ErrorCode::kInternalError:
        return "InternalError";

    default:
        return "UnknownError";
    }
}

// =============================================================================
// Error::toString
// =============================================================================

std::string Error::toString() const {
    if (isOk()) {
        return "OK";
    }

    auto code_str = errorCodeToString(code_);
    if (message_.empty()) {
        return std::string(code_str);
    }

    return fmt::format("{}: {}", code_str, message_);
}

}  // namespace flamingo
