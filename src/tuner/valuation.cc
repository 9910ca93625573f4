// =============================================================================
// Flamingo - Valuation Implementation
// =============================================================================

#include "flamingo/tuner/valuation.h"

#include <algorithm>
#include <functional>

namespace flamingo {
namespace tuner {

namespace {

std::vector<const Valuation::Entry*> sortedEntries(const std::vector<Valuation::Entry>& entries) {
    std::vector<const Valuation::Entry*> sorted;
    sorted.reserve(entries.size());
    for (const auto& entry : entries) {
        sorted.push_back(&entry);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Valuation::Entry* a, const Valuation::Entry* b) {
                  return a->first < b->first;
              });
    return sorted;
}

}  // namespace

Valuation::Valuation(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void Valuation::set(std::string_view name, std::string value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::string(name), std::move(value));
}

bool Valuation::erase(std::string_view name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& entry) { return entry.first == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

const std::string* Valuation::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string Valuation::key() const {
    // Names are identifiers and never contain the separators below
    std::string key;
    for (const auto* entry : sortedEntries(entries_)) {
        key += entry->first;
        key += '\x1d';
        key += entry->second;
        key += '\x1e';
    }
    return key;
}

std::string Valuation::toString(std::string_view sep) const {
    std::string out;
    bool first = true;
    for (const auto* entry : sortedEntries(entries_)) {
        if (!first) {
            out += sep;
        }
        first = false;
        out += entry->first;
        out += " = ";
        out += entry->second;
    }
    return out;
}

bool Valuation::operator==(const Valuation& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& entry : entries_) {
        const std::string* value = other.find(entry.first);
        if (value == nullptr || *value != entry.second) {
            return false;
        }
    }
    return true;
}

size_t ValuationHash::operator()(const Valuation& valuation) const {
    return std::hash<std::string>{}(valuation.key());
}

}  // namespace tuner
}  // namespace flamingo
