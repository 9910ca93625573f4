// =============================================================================
// Flamingo - Configuration Space Implementation
// =============================================================================

#include "flamingo/tuner/configuration_space.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace flamingo {
namespace tuner {

// =============================================================================
// Counting
// =============================================================================

namespace {

constexpr uint64_t kCountMax = std::numeric_limits<uint64_t>::max();

bool checkedMul(uint64_t a, uint64_t b, uint64_t& out) {
    if (a != 0 && b > kCountMax / a) {
        return false;
    }
    out = a * b;
    return true;
}

bool checkedAdd(uint64_t a, uint64_t b, uint64_t& out) {
    if (b > kCountMax - a) {
        return false;
    }
    out = a + b;
    return true;
}

// Number of valuations of the subtree rooted at `index`
bool countSubtree(const VariableTree& tree, size_t index, uint64_t& out) {
    const auto& var = tree.variable(index);
    uint64_t total = 0;

    for (size_t value = 0; value < var.domain.size(); ++value) {
        uint64_t branch = 1;
        for (size_t child : var.children) {
            if (tree.variable(child).activation_index != value) {
                continue;
            }
            uint64_t child_count = 0;
            if (!countSubtree(tree, child, child_count) ||
                !checkedMul(branch, child_count, branch)) {
                return false;
            }
        }
        if (!checkedAdd(total, branch, total)) {
            return false;
        }
    }

    out = total;
    return true;
}

}  // namespace

Result<ConfigurationSpace> ConfigurationSpace::create(VariableTree tree) {
    ConfigurationSpace space;
    space.tree_ = std::move(tree);

    const auto& order = space.tree_.preorder();
    std::vector<size_t> slot_of(space.tree_.numVariables(), 0);
    space.slots_.reserve(order.size());

    for (size_t slot = 0; slot < order.size(); ++slot) {
        size_t index = order[slot];
        const auto& var = space.tree_.variable(index);
        slot_of[index] = slot;

        Slot s;
        s.variable = index;
        s.domain_size = var.domain.size();
        if (var.parent) {
            s.parent_slot = slot_of[*var.parent];
            s.activation_index = var.activation_index;
        }
        space.slots_.push_back(s);
    }

    uint64_t count = 1;
    for (size_t root : space.tree_.roots()) {
        uint64_t root_count = 0;
        if (!countSubtree(space.tree_, root, root_count) ||
            !checkedMul(count, root_count, count)) {
            return Error(ErrorCode::kSearchSpaceTooLarge,
                         "the number of configurations does not fit in 64 bits");
        }
    }
    space.count_ = count;

    spdlog::debug("Configuration space: {} variables, {} configurations",
                  space.tree_.numVariables(), space.count_);
    return space;
}

// =============================================================================
// Cursor
// =============================================================================

ConfigurationSpace::Cursor::Cursor(const ConfigurationSpace& space)
    : space_(&space),
      choice_(space.slots_.size(), 0),
      active_(space.slots_.size(), false) {}

void ConfigurationSpace::Cursor::reset() {
    std::fill(choice_.begin(), choice_.end(), 0);
    std::fill(active_.begin(), active_.end(), false);
    started_ = false;
    done_ = false;
    position_ = 0;
}

void ConfigurationSpace::Cursor::refreshActivity(size_t from) {
    const auto& slots = space_->slots_;
    for (size_t slot = from; slot < slots.size(); ++slot) {
        const auto& s = slots[slot];
        if (!s.parent_slot) {
            active_[slot] = true;
        } else {
            size_t p = *s.parent_slot;
            active_[slot] = active_[p] && choice_[p] == s.activation_index;
        }
    }
}

Valuation ConfigurationSpace::Cursor::current() const {
    Valuation valuation;
    for (size_t slot = 0; slot < choice_.size(); ++slot) {
        if (active_[slot]) {
            valuation.set(space_->slotName(slot), space_->slotDomain(slot)[choice_[slot]]);
        }
    }
    return valuation;
}

std::optional<Valuation> ConfigurationSpace::Cursor::next() {
    if (done_) {
        return std::nullopt;
    }

    if (!started_) {
        started_ = true;
        refreshActivity(0);
        ++position_;
        return current();
    }

    // Advance the last active slot that still has values left; every later
    // slot restarts at its first value. Inactive slots stay at zero, so each
    // valuation corresponds to exactly one choice vector.
    for (size_t slot = choice_.size(); slot-- > 0;) {
        if (!active_[slot] || choice_[slot] + 1 >= space_->slots_[slot].domain_size) {
            continue;
        }
        ++choice_[slot];
        std::fill(choice_.begin() + static_cast<std::ptrdiff_t>(slot) + 1, choice_.end(), 0);
        refreshActivity(slot + 1);
        ++position_;
        return current();
    }

    done_ = true;
    return std::nullopt;
}

// =============================================================================
// Enumeration / Membership
// =============================================================================

std::vector<Valuation> ConfigurationSpace::enumerateAll() const {
    std::vector<Valuation> all;
    if (count_ <= 1u << 20) {
        all.reserve(static_cast<size_t>(count_));
    }
    auto it = cursor();
    while (auto valuation = it.next()) {
        all.push_back(std::move(*valuation));
    }
    return all;
}

bool ConfigurationSpace::contains(const Valuation& valuation) const {
    std::vector<std::optional<size_t>> chosen(slots_.size());
    size_t active_count = 0;

    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        const auto& s = slots_[slot];
        bool active = !s.parent_slot ||
                      (chosen[*s.parent_slot] && *chosen[*s.parent_slot] == s.activation_index);

        const std::string* value = valuation.find(slotName(slot));
        if (!active) {
            if (value != nullptr) {
                return false;
            }
            continue;
        }
        if (value == nullptr) {
            return false;
        }

        const auto& domain = slotDomain(slot);
        auto it = std::find(domain.begin(), domain.end(), *value);
        if (it == domain.end()) {
            return false;
        }
        chosen[slot] = static_cast<size_t>(it - domain.begin());
        ++active_count;
    }

    // No entries for undeclared variables
    return active_count == valuation.size();
}

Valuation ConfigurationSpace::normalize(const Valuation& valuation) const {
    Valuation normalized;
    std::vector<std::optional<size_t>> chosen(slots_.size());

    for (size_t slot = 0; slot < slots_.size(); ++slot) {
        const auto& s = slots_[slot];
        if (s.parent_slot &&
            (!chosen[*s.parent_slot] || *chosen[*s.parent_slot] != s.activation_index)) {
            continue;
        }

        // Unknown or missing values fall back to the first value of the domain
        const auto& domain = slotDomain(slot);
        size_t index = 0;
        if (const std::string* value = valuation.find(slotName(slot))) {
            auto it = std::find(domain.begin(), domain.end(), *value);
            if (it != domain.end()) {
                index = static_cast<size_t>(it - domain.begin());
            }
        }
        normalized.set(slotName(slot), domain[index]);
        chosen[slot] = index;
    }

    return normalized;
}

}  // namespace tuner
}  // namespace flamingo
