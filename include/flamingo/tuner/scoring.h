#pragma once

// =============================================================================
// Flamingo - Scoring
// =============================================================================
//
// Aggregators reduce the repeated figure-of-merit samples of one valuation
// to a single score; the direction decides which of two scores is better.
//

#include "flamingo/error.h"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace flamingo {
namespace tuner {

// =============================================================================
// Aggregator
// =============================================================================

enum class Aggregator : uint8_t {
    kMin = 0,
    kMax = 1,
    kMedian = 2,
    kMean = 3,
};

/// Settings name of an aggregator ("min", "max", "med", "avg")
[[nodiscard]] std::string_view aggregatorName(Aggregator aggregator);

/// Parse an aggregator name (case-insensitive)
[[nodiscard]] Result<Aggregator> parseAggregator(std::string_view name);

/// Reduce samples to one score; nullopt when there are no samples
[[nodiscard]] std::optional<double> aggregate(Aggregator aggregator,
                                              const std::vector<double>& samples);

/// Median with true floating-point division for even-length input
[[nodiscard]] std::optional<double> median(std::vector<double> samples);

/// Arithmetic mean
[[nodiscard]] std::optional<double> mean(const std::vector<double>& samples);

// =============================================================================
// Direction
// =============================================================================

enum class Direction : uint8_t {
    kMinimize = 0,
    kMaximize = 1,
};

[[nodiscard]] std::string_view directionName(Direction direction);

/// Strict comparison: true if `candidate` beats `incumbent`
[[nodiscard]] inline bool isBetter(Direction direction, double candidate, double incumbent) {
    return direction == Direction::kMinimize ? candidate < incumbent : candidate > incumbent;
}

}  // namespace tuner
}  // namespace flamingo
