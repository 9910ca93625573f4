// =============================================================================
// Flamingo - Evaluator Implementation
// =============================================================================

#include "flamingo/tuner/evaluator.h"

#include "flamingo/string_util.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <thread>
#include <unordered_set>

namespace flamingo {
namespace tuner {

std::string_view evaluationPhaseName(EvaluationPhase phase) {
    switch (phase) {
    case EvaluationPhase::kCompile:
        return "compile";
    case EvaluationPhase::kTest:
        return "test";
    case EvaluationPhase::kAnalysis:
        return "analysis";
    default:
        return "unknown";
    }
}

Result<void> validateEvaluatorConfig(const EvaluatorConfig& config) {
    if (trim(config.test.text()).empty()) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError, "a test command is required");
    }
    if (config.repeat == 0) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError,
                              "the number of repetitions must be at least 1");
    }
    if (config.parallelism == 0) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError,
                              "the number of parallel evaluations must be at least 1");
    }
    if (config.command_timeout_seconds < 0.0 || config.cancel_grace_seconds < 0.0) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError,
                              "command time limits cannot be negative");
    }
    if (config.first_test_id == 0) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError, "test ids start at 1");
    }
    FLAMINGO_RETURN_OK();
}

// =============================================================================
// Transcript buffering
// =============================================================================

// With a single worker lines go straight to the transcript. Parallel workers
// collect the lines of one evaluation and emit them in one block.
class Evaluator::TranscriptBuffer {
  public:
    TranscriptBuffer(spdlog::logger* transcript, bool immediate)
        : transcript_(transcript), immediate_(immediate) {}

    ~TranscriptBuffer() { flush(); }

    void line(std::string text) {
        if (transcript_ == nullptr) {
            return;
        }
        if (immediate_) {
            transcript_->info(text);
        } else {
            lines_.push_back(std::move(text));
        }
    }

    void flush() {
        if (transcript_ == nullptr) {
            return;
        }
        for (const auto& text : lines_) {
            transcript_->info(text);
        }
        lines_.clear();
    }

  private:
    spdlog::logger* transcript_;
    bool immediate_;
    std::vector<std::string> lines_;
};

namespace {

std::string_view lastNonEmptyLine(std::string_view text) {
    while (!text.empty()) {
        size_t newline = text.find_last_of('\n');
        std::string_view line =
            newline == std::string_view::npos ? text : text.substr(newline + 1);
        if (!trim(line).empty()) {
            return trim(line);
        }
        if (newline == std::string_view::npos) {
            break;
        }
        text = text.substr(0, newline);
    }
    return {};
}

// Figure of merit of one test run, or why there is none
std::optional<double> extractFom(const CommandResult& result, bool custom_fom,
                                 std::string& why) {
    if (!result.success()) {
        why = result.describe();
        return std::nullopt;
    }
    if (!custom_fom) {
        return result.wall_seconds;
    }

    std::string_view line = lastNonEmptyLine(result.stdout_text);
    if (line.empty()) {
        why = "no output";
        return std::nullopt;
    }
    auto value = parseDouble(line);
    if (!value) {
        why = fmt::format("output '{}' is not a number", line);
    }
    return value;
}

}  // namespace

// =============================================================================
// Evaluator
// =============================================================================

Evaluator::Evaluator(EvaluatorConfig config, std::shared_ptr<CommandRunner> runner,
                     std::shared_ptr<spdlog::logger> transcript)
    : config_(std::move(config)),
      runner_(std::move(runner)),
      transcript_(std::move(transcript)),
      next_id_(config_.first_test_id) {}

CommandOptions Evaluator::commandOptions(const CancellationToken& token) const {
    CommandOptions options;
    options.timeout_seconds = config_.command_timeout_seconds;
    options.working_directory = config_.working_directory;
    options.cancellation = &token;
    options.cancel_grace_seconds = config_.cancel_grace_seconds;
    return options;
}

void Evaluator::notifyPhase(TestId id, EvaluationPhase phase, double percent) const {
    if (phase_callback_) {
        phase_callback_(id, phase, percent);
    }
}

size_t Evaluator::seed(const std::vector<TestRecord>& records) {
    std::lock_guard<std::mutex> lock(commit_mutex_);

    size_t accepted = 0;
    for (const auto& record : records) {
        if (!log_.append(record)) {
            spdlog::warn("Seed record {} repeats an earlier configuration; ignored", record.id);
            continue;
        }
        if (writer_) {
            auto written = writer_->write(record);
            if (!written) {
                spdlog::error("{}", written.error().toString());
            }
        }
        ++accepted;
    }

    // New tests continue after the highest seeded id
    TestId next = std::max(next_id_.load(), log_.nextTestId());
    next_id_.store(next);

    spdlog::debug("Seeded {} of {} records, next test id {}", accepted, records.size(), next);
    return accepted;
}

void Evaluator::commit(const TestRecord& record) {
    {
        std::lock_guard<std::mutex> lock(commit_mutex_);

        if (!log_.append(record)) {
            spdlog::debug("Test {} duplicates a logged configuration; not recorded", record.id);
            return;
        }
        if (writer_) {
            auto written = writer_->write(record);
            if (!written) {
                spdlog::error("{}", written.error().toString());
            }
        }
    }

    // Outside the lock, the callback may call back into the evaluator
    if (record_callback_) {
        record_callback_(record);
    }
}

std::optional<TestRecord> Evaluator::evaluateOne(TestId id, const Valuation& valuation,
                                                 const CancellationToken& token,
                                                 TranscriptBuffer& out) {
    const size_t repeat = config_.repeat;
    auto options = commandOptions(token);
    std::vector<std::optional<double>> scores(repeat);

    out.line(fmt::format("Test {}:", id));
    out.line(valuation.toString(", "));

    auto clean = [&]() {
        if (config_.clean.empty()) {
            return;
        }
        auto result = runner_->run(config_.clean.render(id, valuation), options);
        if (!result) {
            spdlog::warn("Test {}: clean command could not be run: {}", id,
                         result.error().message());
        } else if (!result->success()) {
            spdlog::warn("Test {}: clean command failed ({})", id, result->describe());
        }
    };

    // Compile
    if (!config_.compile.empty()) {
        notifyPhase(id, EvaluationPhase::kCompile, 0.0);
        out.line("Compiling...");

        auto result = runner_->run(config_.compile.render(id, valuation), options);
        notifyPhase(id, EvaluationPhase::kCompile, 100.0);

        if (result && result->cancelled) {
            clean();
            out.line("Cancelled during compilation.");
            return std::nullopt;
        }
        if (!result || !result->success()) {
            if (!result) {
                spdlog::warn("Test {}: {}", id, result.error().message());
            } else if (!result->stderr_text.empty()) {
                spdlog::debug("Test {}: compiler output:\n{}", id, result->stderr_text);
            }
            out.line("Compilation failed.");
            clean();
            return TestRecord::failure(id, valuation, std::move(scores), kReasonCompileFailed);
        }
    }

    // Test repetitions
    size_t launch_failures = 0;
    bool abandoned = false;
    for (size_t rep = 0; rep < repeat; ++rep) {
        notifyPhase(id, EvaluationPhase::kTest,
                    100.0 * static_cast<double>(rep) / static_cast<double>(repeat));
        out.line(repeat > 1 ? fmt::format("Running test ({}/{})...", rep + 1, repeat)
                            : std::string("Running test..."));

        auto result = runner_->run(config_.test.render(id, valuation), options);
        if (!result) {
            ++launch_failures;
            spdlog::warn("Test {}: {}", id, result.error().message());
            out.line("    The test could not be launched.");
            continue;
        }
        if (result->cancelled) {
            abandoned = true;
            break;
        }

        std::string why;
        auto fom = extractFom(*result, config_.custom_fom, why);
        if (fom) {
            scores[rep] = *fom;
            out.line(fmt::format("    Result: {}", *fom));
        } else {
            out.line(fmt::format("    No valid measurement ({}).", why));
        }
    }
    notifyPhase(id, EvaluationPhase::kTest, 100.0);

    clean();

    if (abandoned) {
        out.line("Cancelled during testing.");
        return std::nullopt;
    }

    // Analysis
    notifyPhase(id, EvaluationPhase::kAnalysis, 0.0);

    std::vector<double> valid;
    for (const auto& score : scores) {
        if (score) {
            valid.push_back(*score);
        }
    }

    TestRecord record;
    auto overall = aggregate(config_.aggregator, valid);
    if (!overall) {
        const char* reason =
            launch_failures == repeat ? kReasonLaunchFailed : kReasonNoValidMeasurements;
        out.line(fmt::format("Failed: {}.", reason));
        record = TestRecord::failure(id, valuation, std::move(scores), reason);
    } else {
        if (repeat > 1) {
            out.line(fmt::format("Overall ({}): {}", aggregatorName(config_.aggregator),
                                 *overall));
        }
        record = TestRecord::success(id, valuation, std::move(scores), *overall);
    }

    notifyPhase(id, EvaluationPhase::kAnalysis, 100.0);
    out.line("");
    return record;
}

EvaluationSummary Evaluator::evaluate(const std::vector<Valuation>& valuations,
                                      const CancellationToken& token) {
    EvaluationSummary summary;
    summary.submitted = valuations.size();

    std::vector<std::optional<TestRecord>> results(valuations.size());
    std::vector<Job> jobs;
    std::unordered_set<std::string> submitted;

    // Resolve duplicates and reuse before anything runs
    for (size_t i = 0; i < valuations.size(); ++i) {
        const auto& valuation = valuations[i];
        if (!submitted.insert(valuation.key()).second) {
            ++summary.skipped_duplicates;
            continue;
        }
        if (auto existing = log_.find(valuation)) {
            ++summary.skipped_duplicates;
            results[i] = std::move(*existing);
            continue;
        }
        if (reuse_from_ != nullptr) {
            if (auto reused = reuse_from_->find(valuation)) {
                commit(*reused);
                ++summary.reused;
                results[i] = std::move(*reused);
                continue;
            }
        }
        jobs.push_back(Job{i, &valuation});
    }

    const size_t workers = std::min(config_.parallelism, jobs.size());
    const bool immediate = workers <= 1;

    std::mutex dispatch_mutex;
    size_t next_job = 0;
    std::atomic<size_t> executed{0};
    std::atomic<size_t> failed{0};

    // Finished evaluations wait here until every lower id has finished, so
    // the log and the writer receive them in id order. Abandoned ids hold
    // an empty slot.
    std::mutex order_mutex;
    std::map<TestId, std::optional<TestRecord>> finished;
    TestId next_commit = next_id_.load();

    auto work = [&]() {
        while (true) {
            size_t index;
            TestId id;
            {
                // Ids follow dispatch order
                std::lock_guard<std::mutex> lock(dispatch_mutex);
                if (next_job >= jobs.size() || token.cancelled()) {
                    return;
                }
                index = next_job++;
                id = next_id_.fetch_add(1);
            }

            const Job& job = jobs[index];
            TranscriptBuffer out(transcript_.get(), immediate);
            auto record = evaluateOne(id, *job.valuation, token, out);
            out.flush();
            if (record) {
                ++executed;
                ++tests_run_;
                if (!record->succeeded()) {
                    ++failed;
                }
                results[job.position] = *record;
            }

            std::lock_guard<std::mutex> lock(order_mutex);
            finished.emplace(id, std::move(record));
            while (!finished.empty() && finished.begin()->first == next_commit) {
                auto node = finished.extract(finished.begin());
                if (node.mapped()) {
                    commit(*node.mapped());
                }
                ++next_commit;
            }
        }
    };

    if (workers <= 1) {
        work();
    } else {
        spdlog::debug("Evaluating {} configurations on {} workers", jobs.size(), workers);
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back(work);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    summary.executed = executed.load();
    summary.failed = failed.load();
    summary.cancelled = jobs.size() - summary.executed;

    for (auto& result : results) {
        if (result) {
            summary.records.push_back(std::move(*result));
        }
    }
    return summary;
}

}  // namespace tuner
}  // namespace flamingo
