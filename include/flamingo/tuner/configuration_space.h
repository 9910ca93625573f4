#pragma once

// =============================================================================
// Flamingo - Configuration Space
// =============================================================================
//
// The exact, non-redundant set of valuations of a variable tree. A variable
// whose activation value does not match its parent's choice is left out of
// the valuation entirely, so the size of the space is the conditional
// product of the domains rather than the full cross-product.
//
// Enumeration order is deterministic: variables are visited in pre-order and
// the last active variable varies fastest. Re-enumerating always yields the
// same sequence, which keeps test ids reproducible.
//

#include "flamingo/error.h"
#include "flamingo/tuner/valuation.h"
#include "flamingo/tuner/variable_tree.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace flamingo {
namespace tuner {

class ConfigurationSpace {
  public:
    // -------------------------------------------------------------------------
    // Cursor - restartable lazy enumeration
    // -------------------------------------------------------------------------

    /// The space must outlive its cursors
    class Cursor {
      public:
        explicit Cursor(const ConfigurationSpace& space);

        /// Next valuation, nullopt once the space is exhausted
        [[nodiscard]] std::optional<Valuation> next();

        /// Restart from the first valuation
        void reset();

        /// Number of valuations produced so far
        [[nodiscard]] uint64_t position() const { return position_; }

      private:
        const ConfigurationSpace* space_;
        std::vector<size_t> choice_;  // Domain index per pre-order slot
        std::vector<bool> active_;    // Activity per pre-order slot
        bool started_ = false;
        bool done_ = false;
        uint64_t position_ = 0;

        void refreshActivity(size_t from);
        [[nodiscard]] Valuation current() const;
    };

    ConfigurationSpace() = default;

    /// Build the space of a validated tree
    [[nodiscard]] static Result<ConfigurationSpace> create(VariableTree tree);

    // -------------------------------------------------------------------------
    // Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] const VariableTree& tree() const { return tree_; }

    /// Number of valuations enumerate() produces
    [[nodiscard]] uint64_t count() const { return count_; }

    /// Result-log column order
    [[nodiscard]] std::vector<std::string> flatten() const { return tree_.flatten(); }

    // -------------------------------------------------------------------------
    // Enumeration
    // -------------------------------------------------------------------------

    [[nodiscard]] Cursor cursor() const { return Cursor(*this); }

    /// Materialise the whole enumeration
    [[nodiscard]] std::vector<Valuation> enumerateAll() const;

    // -------------------------------------------------------------------------
    // Membership
    // -------------------------------------------------------------------------

    /// True iff the valuation is produced by the enumeration
    [[nodiscard]] bool contains(const Valuation& valuation) const;

    /// Drop inactive variables and give newly active ones their first value.
    /// Entries come out in pre-order.
    [[nodiscard]] Valuation normalize(const Valuation& valuation) const;

  private:
    struct Slot {
        size_t variable = 0;
        std::optional<size_t> parent_slot;
        size_t activation_index = 0;
        size_t domain_size = 0;
    };

    VariableTree tree_;
    std::vector<Slot> slots_;  // Pre-order
    uint64_t count_ = 0;

    [[nodiscard]] const std::string& slotName(size_t slot) const {
        return tree_.variable(slots_[slot].variable).name;
    }
    [[nodiscard]] const std::vector<std::string>& slotDomain(size_t slot) const {
        return tree_.variable(slots_[slot].variable).domain;
    }
};

}  // namespace tuner
}  // namespace flamingo
