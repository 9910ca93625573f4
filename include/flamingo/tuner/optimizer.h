#pragma once

// =============================================================================
// Flamingo - Optimizer
// =============================================================================
//
// Drives the search over a configuration space.
//
//   Idle -> Running -> { Succeeded | InsufficientResults | Cancelled }
//
// The built-in strategy is exhaustive: every valuation of the space is
// submitted once, in enumeration order, skipping valuations already present
// in the evaluator's log (seeded from a resumed run). The best record is kept
// under the configured direction; ties go to the lower test id.
//
// After a successful run the importance sweep re-tests the optimum with one
// variable changed at a time, using a second evaluator that reuses the main
// log so no configuration is run twice.
//

#include "flamingo/tuner/cancellation.h"
#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/evaluator.h"
#include "flamingo/tuner/scoring.h"
#include "flamingo/tuner/test_record.h"

#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flamingo {
namespace tuner {

enum class OptimizerState : uint8_t {
    kIdle = 0,
    kRunning = 1,
    kSucceeded = 2,
    kInsufficientResults = 3,
    kCancelled = 4,
};

[[nodiscard]] std::string_view optimizerStateName(OptimizerState state);

struct OptimizerConfig {
    Direction direction = Direction::kMinimize;

    // Runs whose failure rate reaches this are not trusted
    double max_failure_rate = 1.0;

    // Valuations handed to the evaluator at once (the evaluator's parallelism)
    size_t batch_size = 1;
};

// =============================================================================
// Importance Report
// =============================================================================

struct ImportanceEntry {
    std::string variable;
    std::vector<std::pair<std::string, std::optional<double>>> scores;  // Per domain value

    /// max - min over the successful scores (0 with fewer than two)
    [[nodiscard]] double spread() const;
};

struct ImportanceReport {
    std::vector<ImportanceEntry> entries;
    size_t candidates = 0;
    size_t executed = 0;
    bool cancelled = false;

    [[nodiscard]] std::string toString() const;
};

using ProgressCallback = std::function<void(uint64_t completed, uint64_t total)>;
using BestCallback = std::function<void(const TestRecord&)>;

// =============================================================================
// OptimizationStrategy - capability interface for search drivers
// =============================================================================

class OptimizationStrategy {
  public:
    virtual ~OptimizationStrategy() = default;

    virtual void setDirection(Direction direction) = 0;

    /// Run the search to a terminal state
    virtual OptimizerState run(const CancellationToken& token) = 0;

    /// One-variable-at-a-time sweep around `optimum` on `sweep`
    virtual Result<ImportanceReport> runImportance(const Valuation& optimum,
                                                   EvaluationStrategy& sweep,
                                                   const CancellationToken& token) = 0;

    [[nodiscard]] virtual OptimizerState state() const = 0;
    [[nodiscard]] virtual uint64_t testsRequired() const = 0;
    [[nodiscard]] virtual uint64_t testsRemaining() const = 0;
    [[nodiscard]] virtual size_t numTests() const = 0;
    [[nodiscard]] virtual std::vector<TestRecord> failures() const = 0;
    [[nodiscard]] virtual std::optional<TestRecord> best() const = 0;

    /// Completed/total after every record
    void setProgressCallback(ProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }

    /// A record beat the previous best
    void setBestCallback(BestCallback callback) { best_callback_ = std::move(callback); }

  protected:
    ProgressCallback progress_callback_;
    BestCallback best_callback_;
};

// =============================================================================
// Optimizer - exhaustive search
// =============================================================================

class Optimizer : public OptimizationStrategy {
  public:
    /// The space and the evaluator must outlive the optimizer
    Optimizer(const ConfigurationSpace& space, EvaluationStrategy& evaluator,
              OptimizerConfig config, std::shared_ptr<spdlog::logger> transcript);

    void setDirection(Direction direction) override;

    OptimizerState run(const CancellationToken& token) override;

    Result<ImportanceReport> runImportance(const Valuation& optimum, EvaluationStrategy& sweep,
                                           const CancellationToken& token) override;

    [[nodiscard]] OptimizerState state() const override { return state_; }
    [[nodiscard]] uint64_t testsRequired() const override { return space_.count(); }
    [[nodiscard]] uint64_t testsRemaining() const override;
    [[nodiscard]] size_t numTests() const override { return evaluator_.log().size(); }
    [[nodiscard]] std::vector<TestRecord> failures() const override {
        return evaluator_.log().failures();
    }
    [[nodiscard]] std::optional<TestRecord> best() const override { return best_; }

    [[nodiscard]] std::optional<Valuation> bestValuation() const;
    [[nodiscard]] std::optional<double> bestScore() const;

    [[nodiscard]] Direction direction() const { return config_.direction; }

    /// Candidates of the importance sweep: the optimum with each active
    /// variable set to each of its values, normalized, duplicates removed
    [[nodiscard]] static std::vector<Valuation> importanceCandidates(
        const ConfigurationSpace& space, const Valuation& optimum);

  private:
    const ConfigurationSpace& space_;
    EvaluationStrategy& evaluator_;
    OptimizerConfig config_;
    std::shared_ptr<spdlog::logger> transcript_;

    OptimizerState state_ = OptimizerState::kIdle;
    std::optional<TestRecord> best_;

    /// Update the best record; true if it changed
    bool consider(const TestRecord& record);

    [[nodiscard]] OptimizerState finalState() const;
};

}  // namespace tuner
}  // namespace flamingo
