#pragma once

// =============================================================================
// Flamingo - String Utilities
// =============================================================================

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flamingo {

/// Strip leading and trailing whitespace
[[nodiscard]] std::string_view trim(std::string_view text);

/// Split on a separator, trimming each piece. Empty pieces are kept.
[[nodiscard]] std::vector<std::string> splitTrimmed(std::string_view text, char sep);

/// Parse a finite floating-point number; the whole (trimmed) text must be consumed
[[nodiscard]] std::optional<double> parseDouble(std::string_view text);

/// Parse a non-negative integer; the whole (trimmed) text must be consumed
[[nodiscard]] std::optional<unsigned long long> parseUnsigned(std::string_view text);

/// Lower-case ASCII copy
[[nodiscard]] std::string toLower(std::string_view text);

/// Format a duration in seconds the way the transcript prints it ("1m2.50s")
[[nodiscard]] std::string formatDuration(double seconds);

}  // namespace flamingo
