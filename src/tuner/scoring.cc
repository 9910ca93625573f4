// =============================================================================
// Flamingo - Scoring Implementation
// =============================================================================

#include "flamingo/tuner/scoring.h"

#include "flamingo/string_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

namespace flamingo {
namespace tuner {

// =============================================================================
// Aggregator
// =============================================================================

std::string_view aggregatorName(Aggregator aggregator) {
    switch (aggregator) {
    case Aggregator::kMin:
        return "min";
    case Aggregator::kMax:
        return "max";
    case Aggregator::kMedian:
        return "med";
    case Aggregator::kMean:
        return "avg";
    default:
        return "unknown";
    }
}

Result<Aggregator> parseAggregator(std::string_view name) {
    auto lowered = toLower(trim(name));
    if (lowered == "min")
        return Aggregator::kMin;
    if (lowered == "max")
        return Aggregator::kMax;
    if (lowered == "med")
        return Aggregator::kMedian;
    if (lowered == "avg")
        return Aggregator::kMean;

    return Error(ErrorCode::kConfigurationError,
                 fmt::format("invalid aggregation method '{}', expected one of: max, min, med, avg",
                             name));
}

std::optional<double> median(std::vector<double> samples) {
    if (samples.empty()) {
        return std::nullopt;
    }
    std::sort(samples.begin(), samples.end());
    size_t n = samples.size();
    if (n % 2 == 1) {
        return samples[n / 2];
    }
    return (samples[n / 2 - 1] + samples[n / 2]) / 2.0;
}

std::optional<double> mean(const std::vector<double>& samples) {
    if (samples.empty()) {
        return std::nullopt;
    }
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<double>(samples.size());
}

std::optional<double> aggregate(Aggregator aggregator, const std::vector<double>& samples) {
    if (samples.empty()) {
        return std::nullopt;
    }

    switch (aggregator) {
    case Aggregator::kMin:
        return *std::min_element(samples.begin(), samples.end());
    case Aggregator::kMax:
        return *std::max_element(samples.begin(), samples.end());
    case Aggregator::kMedian:
        return median(samples);
    case Aggregator::kMean:
        return mean(samples);
    default:
        return std::nullopt;
    }
}

// =============================================================================
// Direction
// =============================================================================

std::string_view directionName(Direction direction) {
    return direction == Direction::kMinimize ? "min" : "max";
}

}  // namespace tuner
}  // namespace flamingo
