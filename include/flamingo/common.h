#pragma once

// =============================================================================
// Flamingo - Common Definitions
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <string_view>

// Version information
#define FLAMINGO_VERSION_MAJOR 0
#define FLAMINGO_VERSION_MINOR 1
#define FLAMINGO_VERSION_PATCH 0

namespace flamingo {

// =============================================================================
// Compiler Attributes
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define FLAMINGO_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define FLAMINGO_UNLIKELY(x) (x)
#endif

// =============================================================================
// Version
// =============================================================================

struct Version {
    static constexpr int kMajor = FLAMINGO_VERSION_MAJOR;
    static constexpr int kMinor = FLAMINGO_VERSION_MINOR;
    static constexpr int kPatch = FLAMINGO_VERSION_PATCH;

    static constexpr std::string_view string() { return "0.1.0"; }
};

// =============================================================================
// Debug Macros
// =============================================================================

#ifdef NDEBUG
    #define FLAMINGO_ASSERT(cond) ((void)0)
#else
    #define FLAMINGO_ASSERT(cond)                                  \
        do {                                                       \
            if (FLAMINGO_UNLIKELY(!(cond))) {                      \
                flamingo::assertFailed(#cond, __FILE__, __LINE__); \
            }                                                      \
        } while (0)
#endif

// Assert failure handler (implemented in error.cc)
[[noreturn]] void assertFailed(const char* cond, const char* file, int line);

// =============================================================================
// Utility Types
// =============================================================================

// Non-copyable base class
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

}  // namespace flamingo
