#pragma once

// =============================================================================
// Flamingo - Valuation
// =============================================================================
//
// A valuation assigns one value to every variable that is active on a given
// branch of the variable tree. Entries keep insertion order for rendering and
// logging; equality and hashing ignore order.
//

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flamingo {
namespace tuner {

class Valuation {
  public:
    using Entry = std::pair<std::string, std::string>;

    Valuation() = default;
    Valuation(std::initializer_list<Entry> entries);

    /// Assign a value; an existing entry keeps its position
    void set(std::string_view name, std::string value);

    /// Remove an entry, returns false if absent
    bool erase(std::string_view name);

    /// Lookup, nullptr if the variable is not part of this valuation
    [[nodiscard]] const std::string* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

    /// Canonical, order-independent key
    [[nodiscard]] std::string key() const;

    /// "name = value" pairs sorted by name, joined by sep
    [[nodiscard]] std::string toString(std::string_view sep = "\n") const;

    bool operator==(const Valuation& other) const;
    bool operator!=(const Valuation& other) const { return !(*this == other); }

  private:
    std::vector<Entry> entries_;
};

struct ValuationHash {
    size_t operator()(const Valuation& valuation) const;
};

}  // namespace tuner
}  // namespace flamingo
