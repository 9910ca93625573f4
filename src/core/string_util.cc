// =============================================================================
// Flamingo - String Utilities Implementation
// =============================================================================

#include "flamingo/string_util.h"

#include <fmt/format.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace flamingo {

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> splitTrimmed(std::string_view text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(trim(text.substr(start)));
            break;
        }
        parts.emplace_back(trim(text.substr(start, pos - start)));
        start = pos + 1;
    }
    return parts;
}

std::optional<double> parseDouble(std::string_view text) {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    // strtod needs a NUL-terminated buffer
    std::string buffer(trimmed);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<unsigned long long> parseUnsigned(std::string_view text) {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    for (char c : trimmed) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    std::string buffer(trimmed);
    errno = 0;
    unsigned long long value = std::strtoull(buffer.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

std::string toLower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string formatDuration(double seconds) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    double minutes = std::floor(seconds / 60.0);
    double rest = seconds - minutes * 60.0;
    return fmt::format("{:.0f}m{:.2f}s", minutes, rest);
}

}  // namespace flamingo
