// =============================================================================
// Flamingo - Optimizer Implementation
// =============================================================================

#include "flamingo/tuner/optimizer.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace flamingo {
namespace tuner {

std::string_view optimizerStateName(OptimizerState state) {
    switch (state) {
    case OptimizerState::kIdle:
        return "idle";
    case OptimizerState::kRunning:
        return "running";
    case OptimizerState::kSucceeded:
        return "succeeded";
    case OptimizerState::kInsufficientResults:
        return "insufficient_results";
    case OptimizerState::kCancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

// =============================================================================
// Importance Report
// =============================================================================

double ImportanceEntry::spread() const {
    std::optional<double> lo, hi;
    for (const auto& [value, score] : scores) {
        if (!score) {
            continue;
        }
        lo = lo ? std::min(*lo, *score) : *score;
        hi = hi ? std::max(*hi, *score) : *score;
    }
    return lo ? *hi - *lo : 0.0;
}

std::string ImportanceReport::toString() const {
    std::string out;
    for (const auto& entry : entries) {
        out += fmt::format("{} (spread {}):\n", entry.variable, entry.spread());
        for (const auto& [value, score] : entry.scores) {
            out += fmt::format("    {} = {}: {}\n", entry.variable, value,
                               score ? fmt::format("{}", *score) : std::string("failed"));
        }
    }
    return out;
}

// =============================================================================
// Optimizer
// =============================================================================

Optimizer::Optimizer(const ConfigurationSpace& space, EvaluationStrategy& evaluator,
                     OptimizerConfig config, std::shared_ptr<spdlog::logger> transcript)
    : space_(space),
      evaluator_(evaluator),
      config_(config),
      transcript_(std::move(transcript)) {
    config_.batch_size = std::max<size_t>(config_.batch_size, 1);
}

void Optimizer::setDirection(Direction direction) {
    if (state_ == OptimizerState::kRunning) {
        spdlog::warn("Optimization direction cannot change while running");
        return;
    }
    config_.direction = direction;
}

uint64_t Optimizer::testsRemaining() const {
    uint64_t done = evaluator_.log().size();
    uint64_t total = space_.count();
    return done >= total ? 0 : total - done;
}

std::optional<Valuation> Optimizer::bestValuation() const {
    if (!best_) {
        return std::nullopt;
    }
    return best_->valuation;
}

std::optional<double> Optimizer::bestScore() const {
    if (!best_) {
        return std::nullopt;
    }
    return best_->aggregate_score;
}

bool Optimizer::consider(const TestRecord& record) {
    if (!record.succeeded()) {
        return false;
    }
    double score = *record.aggregate_score;

    if (best_) {
        double incumbent = *best_->aggregate_score;
        bool better = isBetter(config_.direction, score, incumbent);
        bool earlier_tie = score == incumbent && record.id < best_->id;
        if (!better && !earlier_tie) {
            return false;
        }
    }
    best_ = record;
    return true;
}

OptimizerState Optimizer::finalState() const {
    const auto& log = evaluator_.log();
    size_t total = log.size();
    size_t failed = log.numFailures();
    if (total == 0 || failed == total) {
        return OptimizerState::kInsufficientResults;
    }

    double failure_rate = static_cast<double>(failed) / static_cast<double>(total);
    if (failure_rate >= config_.max_failure_rate) {
        spdlog::debug("Failure rate {:.3f} reaches the limit {:.3f}", failure_rate,
                      config_.max_failure_rate);
        return OptimizerState::kInsufficientResults;
    }
    return OptimizerState::kSucceeded;
}

OptimizerState Optimizer::run(const CancellationToken& token) {
    if (state_ != OptimizerState::kIdle) {
        spdlog::warn("Optimizer already ran (state: {})", optimizerStateName(state_));
        return state_;
    }
    state_ = OptimizerState::kRunning;

    const uint64_t total = space_.count();

    // Records seeded from a resumed log take part in the comparison
    best_.reset();
    auto existing = evaluator_.log().snapshot();
    std::sort(existing.begin(), existing.end(),
              [](const TestRecord& a, const TestRecord& b) { return a.id < b.id; });
    for (const auto& record : existing) {
        consider(record);
    }
    uint64_t completed = existing.size();

    if (transcript_) {
        transcript_->info(fmt::format("Number of tests to be run: {}", total));
        if (completed > 0) {
            transcript_->info(fmt::format("({} already tested in the resumed log)", completed));
        }
        transcript_->info("");
    }
    spdlog::debug("Exhaustive search over {} configurations, {} known, direction {}", total,
                  completed, directionName(config_.direction));

    auto cursor = space_.cursor();
    std::vector<Valuation> batch;
    batch.reserve(config_.batch_size);
    bool cancelled = false;

    while (true) {
        batch.clear();
        while (batch.size() < config_.batch_size) {
            auto valuation = cursor.next();
            if (!valuation) {
                break;
            }
            if (evaluator_.log().contains(*valuation)) {
                continue;
            }
            batch.push_back(std::move(*valuation));
        }
        if (batch.empty()) {
            break;
        }

        if (token.cancelled()) {
            cancelled = true;
            break;
        }

        auto summary = evaluator_.evaluate(batch, token);
        for (const auto& record : summary.records) {
            ++completed;
            if (progress_callback_) {
                progress_callback_(completed, total);
            }
            if (consider(record) && best_callback_) {
                best_callback_(record);
            }
        }

        if (summary.cancelled > 0 || token.cancelled()) {
            cancelled = true;
            break;
        }
    }

    state_ = cancelled ? OptimizerState::kCancelled : finalState();
    spdlog::debug("Search finished: {} ({} tests, {} failures)", optimizerStateName(state_),
                  evaluator_.log().size(), evaluator_.log().numFailures());
    return state_;
}

// =============================================================================
// Importance Sweep
// =============================================================================

std::vector<Valuation> Optimizer::importanceCandidates(const ConfigurationSpace& space,
                                                       const Valuation& optimum) {
    std::vector<Valuation> candidates;
    std::unordered_set<std::string> seen;

    for (const auto& name : space.flatten()) {
        if (!optimum.contains(name)) {
            continue;
        }
        const auto* variable = space.tree().find(name);
        for (const auto& value : variable->domain) {
            Valuation candidate = optimum;
            candidate.set(name, value);
            candidate = space.normalize(candidate);
            if (seen.insert(candidate.key()).second) {
                candidates.push_back(std::move(candidate));
            }
        }
    }
    return candidates;
}

Result<ImportanceReport> Optimizer::runImportance(const Valuation& optimum,
                                                  EvaluationStrategy& sweep,
                                                  const CancellationToken& token) {
    if (!space_.contains(optimum)) {
        return Error(ErrorCode::kInvalidInput,
                     fmt::format("({}) is not a configuration of the search space",
                                 optimum.toString(", ")));
    }

    auto candidates = importanceCandidates(space_, optimum);

    if (transcript_) {
        transcript_->info("");
        transcript_->info("Additional tests to check parameter importance:");
        transcript_->info("");
    }

    auto summary = sweep.evaluate(candidates, token);

    if (transcript_ && summary.executed == 0) {
        transcript_->info("(None required)");
    }

    ImportanceReport report;
    report.candidates = candidates.size();
    report.executed = summary.executed;
    report.cancelled = summary.cancelled > 0;

    const auto& log = sweep.log();
    for (const auto& name : space_.flatten()) {
        if (!optimum.contains(name)) {
            continue;
        }
        ImportanceEntry entry;
        entry.variable = name;
        for (const auto& value : space_.tree().find(name)->domain) {
            Valuation candidate = optimum;
            candidate.set(name, value);
            auto record = log.find(space_.normalize(candidate));
            std::optional<double> score;
            if (record && record->succeeded()) {
                score = record->aggregate_score;
            }
            entry.scores.emplace_back(value, score);
        }
        report.entries.push_back(std::move(entry));
    }

    spdlog::debug("Importance sweep: {} candidates, {} executed", report.candidates,
                  report.executed);
    return report;
}

}  // namespace tuner
}  // namespace flamingo
