#pragma once

// =============================================================================
// Flamingo - Evaluator
// =============================================================================
//
// Runs the compile/test/clean cycle of valuations and records one TestRecord
// per distinct valuation.
//
// - A valuation that is already in this evaluator's log is never executed
//   again; neither is one found in the optional reuse source (the main log
//   when sweeping parameter importance), whose record is copied instead.
// - Test ids are handed out in submission order when a valuation is
//   dispatched. Finished records are held back until every lower id has
//   finished, so the log and the writer stay ordered by id even when
//   workers finish out of order.
// - A failing test is recorded, never reported as an error.
// - Cancellation is checked before each dispatch. Commands already running
//   are allowed to finish within the grace period; an evaluation whose
//   command had to be killed is abandoned rather than recorded.
//

#include "flamingo/tuner/cancellation.h"
#include "flamingo/tuner/command_runner.h"
#include "flamingo/tuner/command_template.h"
#include "flamingo/tuner/result_log.h"
#include "flamingo/tuner/scoring.h"
#include "flamingo/tuner/test_record.h"
#include "flamingo/tuner/valuation.h"

#include <spdlog/logger.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flamingo {
namespace tuner {

enum class EvaluationPhase : uint8_t {
    kCompile = 0,
    kTest = 1,
    kAnalysis = 2,
};

[[nodiscard]] std::string_view evaluationPhaseName(EvaluationPhase phase);

struct EvaluatorConfig {
    CommandTemplate compile;  // Optional
    CommandTemplate test;     // Required
    CommandTemplate clean;    // Optional

    size_t repeat = 1;
    Aggregator aggregator = Aggregator::kMin;

    // true: the test prints its figure of merit as the last line of stdout.
    // false: the wall-clock time of the test process is the figure of merit.
    bool custom_fom = true;

    double command_timeout_seconds = 0.0;
    double cancel_grace_seconds = 10.0;
    std::string working_directory;

    size_t parallelism = 1;
    TestId first_test_id = 1;
};

/// Reports configuration errors of an evaluator setup
[[nodiscard]] Result<void> validateEvaluatorConfig(const EvaluatorConfig& config);

struct EvaluationSummary {
    size_t submitted = 0;
    size_t executed = 0;            // Valuations actually run
    size_t reused = 0;              // Copied from the reuse source
    size_t skipped_duplicates = 0;  // Already in the log or repeated in the input
    size_t failed = 0;              // Executed and recorded as failures
    size_t cancelled = 0;           // Never dispatched or abandoned

    // Records of the submitted valuations, in submission order (one per
    // distinct valuation that has a record)
    std::vector<TestRecord> records;
};

using RecordCallback = std::function<void(const TestRecord&)>;
using PhaseCallback = std::function<void(TestId, EvaluationPhase, double percent)>;

// =============================================================================
// EvaluationStrategy - capability interface for evaluators
// =============================================================================

class EvaluationStrategy {
  public:
    virtual ~EvaluationStrategy() = default;

    /// Evaluate valuations; records are appended to log()
    virtual EvaluationSummary evaluate(const std::vector<Valuation>& valuations,
                                       const CancellationToken& token) = 0;

    /// Preload records from a previous run; returns how many were accepted
    virtual size_t seed(const std::vector<TestRecord>& records) = 0;

    [[nodiscard]] virtual const ResultLog& log() const = 0;

    /// Number of valuations executed (not reused or seeded)
    [[nodiscard]] virtual size_t testsRun() const = 0;

    /// Called once for every record appended to the log
    void setRecordCallback(RecordCallback callback) { record_callback_ = std::move(callback); }

    /// Progress inside one evaluation, for display only
    void setPhaseCallback(PhaseCallback callback) { phase_callback_ = std::move(callback); }

  protected:
    RecordCallback record_callback_;
    PhaseCallback phase_callback_;
};

// =============================================================================
// Evaluator - runs external commands
// =============================================================================

class Evaluator : public EvaluationStrategy, NonCopyable {
  public:
    Evaluator(EvaluatorConfig config, std::shared_ptr<CommandRunner> runner,
              std::shared_ptr<spdlog::logger> transcript);

    EvaluationSummary evaluate(const std::vector<Valuation>& valuations,
                               const CancellationToken& token) override;

    size_t seed(const std::vector<TestRecord>& records) override;

    [[nodiscard]] const ResultLog& log() const override { return log_; }
    [[nodiscard]] size_t testsRun() const override { return tests_run_.load(); }

    /// Records found here are reused instead of re-run (must outlive this)
    void setReuseSource(const ResultLog* source) { reuse_from_ = source; }

    /// Every appended record is also streamed to this writer
    void setLogWriter(std::shared_ptr<ResultLogWriter> writer) { writer_ = std::move(writer); }

    [[nodiscard]] const EvaluatorConfig& config() const { return config_; }

    /// Id the next dispatched valuation receives
    [[nodiscard]] TestId nextTestId() const { return next_id_.load(); }

  private:
    struct Job {
        size_t position = 0;  // Index in the submitted list
        const Valuation* valuation = nullptr;
    };

    class TranscriptBuffer;

    EvaluatorConfig config_;
    std::shared_ptr<CommandRunner> runner_;
    std::shared_ptr<spdlog::logger> transcript_;
    std::shared_ptr<ResultLogWriter> writer_;
    const ResultLog* reuse_from_ = nullptr;

    ResultLog log_;
    std::atomic<TestId> next_id_;
    std::atomic<size_t> tests_run_{0};
    std::mutex commit_mutex_;

    /// Full cycle of one valuation; nullopt if abandoned due to cancellation
    std::optional<TestRecord> evaluateOne(TestId id, const Valuation& valuation,
                                          const CancellationToken& token,
                                          TranscriptBuffer& out);

    /// Append and stream under the commit lock, then notify
    void commit(const TestRecord& record);

    [[nodiscard]] CommandOptions commandOptions(const CancellationToken& token) const;
    void notifyPhase(TestId id, EvaluationPhase phase, double percent) const;
};

}  // namespace tuner
}  // namespace flamingo
