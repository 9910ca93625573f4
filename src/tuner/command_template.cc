// =============================================================================
// Flamingo - Command Template Implementation
// =============================================================================

#include "flamingo/tuner/command_template.h"

#include <string_view>

namespace flamingo {
namespace tuner {

namespace {

constexpr std::string_view kIdToken = "%%ID%%";

}  // namespace

std::string CommandTemplate::render(TestId id, const Valuation& valuation) const {
    std::string out;
    out.reserve(text_.size() + 16);
    std::string_view text = text_;

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '%') {
            out.push_back(text[pos++]);
            continue;
        }

        if (text.substr(pos, kIdToken.size()) == kIdToken) {
            out += std::to_string(id);
            pos += kIdToken.size();
            continue;
        }

        size_t close = text.find('%', pos + 1);
        if (close != std::string_view::npos && close > pos + 1) {
            const std::string* value = valuation.find(text.substr(pos + 1, close - pos - 1));
            if (value != nullptr) {
                out += *value;
                pos = close + 1;
                continue;
            }
        }

        // Not a token, keep the '%' and carry on after it
        out.push_back(text[pos++]);
    }
    return out;
}

}  // namespace tuner
}  // namespace flamingo
