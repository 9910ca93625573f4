#pragma once

// =============================================================================
// Flamingo - Command Template
// =============================================================================
//
// Compile, test and clean commands are shell command templates:
//
//   %%ID%%          replaced by the test id
//   %<variable>%    replaced by the value chosen for <variable>
//
// Substitution is a single left-to-right pass, so values that themselves
// contain '%' are never re-expanded. Tokens that name no variable of the
// valuation (for example inactive variables) are kept verbatim.
//

#include "flamingo/tuner/test_record.h"
#include "flamingo/tuner/valuation.h"

#include <string>

namespace flamingo {
namespace tuner {

class CommandTemplate {
  public:
    CommandTemplate() = default;
    explicit CommandTemplate(std::string text) : text_(std::move(text)) {}

    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] bool empty() const { return text_.empty(); }

    [[nodiscard]] std::string render(TestId id, const Valuation& valuation) const;

  private:
    std::string text_;
};

}  // namespace tuner
}  // namespace flamingo
