#pragma once

// =============================================================================
// Flamingo - Tuning Session
// =============================================================================
//
// Wires a complete tuning run together from a TuningSettings record:
//
//   settings -> variable tree -> configuration space
//            -> transcript, command runner
//            -> evaluator (seeded from the resumed log, streaming to the log)
//            -> optimizer -> [importance sweep] -> summary
//
// Everything that can be misconfigured is checked in create(), before any
// command runs. run() never fails because a test failed; it reports the
// terminal optimizer state instead.
//

#include "flamingo/common.h"
#include "flamingo/error.h"
#include "flamingo/tuner/cancellation.h"
#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/evaluator.h"
#include "flamingo/tuner/optimizer.h"
#include "flamingo/tuner/result_log.h"
#include "flamingo/tuner/settings.h"
#include "flamingo/tuner/strategy_registry.h"

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>

namespace flamingo {
namespace tuner {

struct SessionOptions {
    // Defaults to a ShellCommandRunner
    std::shared_ptr<CommandRunner> runner;

    // Overrides the transcript built from the settings (console + script file)
    std::shared_ptr<spdlog::logger> transcript;
    bool console = true;

    StrategyRegistry registry = StrategyRegistry::withBuiltins();

    // Forwarded to the strategies
    ProgressCallback on_progress;
    RecordCallback on_record;
    PhaseCallback on_phase;
};

struct SessionResult {
    OptimizerState state = OptimizerState::kIdle;
    std::optional<TestRecord> best;

    uint64_t tests_required = 0;
    size_t tests_logged = 0;  // Records in the main log, resumed ones included
    size_t tests_run = 0;     // Executed by this run
    size_t resumed = 0;       // Records loaded from the resumed log
    size_t failures = 0;

    std::optional<ImportanceReport> importance;
    size_t importance_tests_run = 0;

    double search_seconds = 0.0;
    double importance_seconds = 0.0;
};

/// JSON document describing a finished session
[[nodiscard]] std::string sessionSummaryJson(const SessionResult& result,
                                             const TuningSettings& settings);

class TuningSession : NonCopyable {
  public:
    /// Validate settings and build every component; nothing is executed yet
    [[nodiscard]] static Result<std::unique_ptr<TuningSession>> create(
        TuningSettings settings, SessionOptions options = {});

    /// Search, then (when configured and successful) sweep parameter importance
    [[nodiscard]] Result<SessionResult> run(const CancellationToken& token);

    [[nodiscard]] const TuningSettings& settings() const { return settings_; }
    [[nodiscard]] const ConfigurationSpace& space() const { return space_; }
    [[nodiscard]] const EvaluationStrategy& evaluator() const { return *evaluator_; }
    [[nodiscard]] const OptimizationStrategy& optimizer() const { return *optimizer_; }
    [[nodiscard]] const EvaluationStrategy* importanceEvaluator() const {
        return importance_evaluator_.get();
    }

  private:
    TuningSession() = default;

    TuningSettings settings_;
    SessionOptions options_;
    ConfigurationSpace space_;
    std::shared_ptr<spdlog::logger> transcript_;
    bool script_failed_ = false;

    std::shared_ptr<CommandRunner> runner_;
    std::shared_ptr<ResultLogWriter> log_writer_;
    std::shared_ptr<ResultLogWriter> importance_writer_;
    size_t resumed_ = 0;

    std::unique_ptr<EvaluationStrategy> evaluator_;
    std::unique_ptr<OptimizationStrategy> optimizer_;
    std::unique_ptr<EvaluationStrategy> importance_evaluator_;

    void printIntroduction() const;
    void printResults(const SessionResult& result) const;
    void printFailures() const;
    void printOutputs(const SessionResult& result) const;
    [[nodiscard]] Result<void> runImportance(const Valuation& optimum,
                                             const CancellationToken& token,
                                             SessionResult& result);
};

}  // namespace tuner
}  // namespace flamingo
