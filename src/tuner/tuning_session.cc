// =============================================================================
// Flamingo - Tuning Session Implementation
// =============================================================================

#include "flamingo/tuner/tuning_session.h"

#include "flamingo/string_util.h"
#include "flamingo/transcript.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>

namespace flamingo {
namespace tuner {

namespace {

constexpr const char* kTranscriptName = "flamingo.transcript";
constexpr size_t kBannerWidth = 80;

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

std::string centered(const std::string& text) {
    if (text.size() >= kBannerWidth) {
        return text;
    }
    return std::string((kBannerWidth - text.size()) / 2, ' ') + text;
}

std::string optimalWord(Direction direction) {
    return direction == Direction::kMinimize ? "Minimal" : "Maximal";
}

}  // namespace

// =============================================================================
// Summary
// =============================================================================

std::string sessionSummaryJson(const SessionResult& result, const TuningSettings& settings) {
    nlohmann::json j;
    j["state"] = std::string(optimizerStateName(result.state));
    j["direction"] = std::string(directionName(settings.direction));
    j["tests_required"] = result.tests_required;
    j["tests_logged"] = result.tests_logged;
    j["tests_run"] = result.tests_run;
    j["resumed"] = result.resumed;
    j["failures"] = result.failures;
    j["search_seconds"] = result.search_seconds;

    if (result.best) {
        nlohmann::json bj;
        bj["test_id"] = result.best->id;
        bj["score"] = *result.best->aggregate_score;
        nlohmann::json vj = nlohmann::json::object();
        for (const auto& [name, value] : result.best->valuation) {
            vj[name] = value;
        }
        bj["valuation"] = vj;
        j["best"] = bj;
    } else {
        j["best"] = nullptr;
    }

    if (result.importance) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : result.importance->entries) {
            nlohmann::json ej;
            ej["variable"] = entry.variable;
            ej["spread"] = entry.spread();
            nlohmann::json scores = nlohmann::json::object();
            for (const auto& [value, score] : entry.scores) {
                if (score) {
                    scores[value] = *score;
                } else {
                    scores[value] = nullptr;
                }
            }
            ej["scores"] = scores;
            entries.push_back(ej);
        }
        j["importance"] = entries;
        j["importance_tests_run"] = result.importance_tests_run;
        j["importance_seconds"] = result.importance_seconds;
    }

    return j.dump(2);
}

// =============================================================================
// Construction
// =============================================================================

Result<std::unique_ptr<TuningSession>> TuningSession::create(TuningSettings settings,
                                                             SessionOptions options) {
    FLAMINGO_TRY(settings.validate());

    std::unique_ptr<TuningSession> session(new TuningSession());
    session->settings_ = std::move(settings);
    session->options_ = std::move(options);
    const auto& s = session->settings_;

    // Search space
    auto tree = VariableTree::parse(s.variables, s.values);
    if (!tree) {
        return tree.error();
    }
    auto space = ConfigurationSpace::create(std::move(*tree));
    if (!space) {
        return space.error();
    }
    session->space_ = std::move(*space);

    // Transcript
    if (session->options_.transcript) {
        session->transcript_ = session->options_.transcript;
    } else {
        TranscriptOptions transcript_options;
        transcript_options.console = session->options_.console;
        transcript_options.file_path = s.script_path.value_or("");
        auto transcript = makeTranscript(kTranscriptName, transcript_options);
        if (!transcript) {
            spdlog::warn("{}; no script will be saved", transcript.error().message());
            session->script_failed_ = true;
            transcript_options.file_path.clear();
            transcript = makeTranscript(kTranscriptName, transcript_options);
            if (!transcript) {
                return transcript.error();
            }
        }
        session->transcript_ = *transcript;
    }

    session->runner_ = session->options_.runner ? session->options_.runner
                                                : std::make_shared<ShellCommandRunner>();

    // The resumed log is read completely before the output log is opened
    std::vector<TestRecord> resumed;
    if (s.resume_path) {
        auto loaded = readResultLog(*s.resume_path, session->space_);
        if (!loaded) {
            return loaded.error();
        }
        if (loaded->repeat != s.repeat) {
            spdlog::warn("The resumed log has {} repetitions per test, this run uses {}",
                         loaded->repeat, s.repeat);
        }
        resumed = std::move(loaded->records);
    }

    const auto columns = session->space_.flatten();
    if (s.log_path) {
        auto writer = ResultLogWriter::open(*s.log_path, columns, s.repeat);
        if (!writer) {
            return writer.error();
        }
        session->log_writer_ = std::move(*writer);
    }
    if (s.importance_path) {
        auto writer = ResultLogWriter::open(*s.importance_path, columns, s.repeat);
        if (!writer) {
            return writer.error();
        }
        session->importance_writer_ = std::move(*writer);
    }

    // Strategies
    EvaluationContext evaluation;
    evaluation.config = s.evaluatorConfig();
    evaluation.runner = session->runner_;
    evaluation.transcript = session->transcript_;
    evaluation.log_writer = session->log_writer_;

    auto evaluator = session->options_.registry.createEvaluation(s.evaluation_strategy, evaluation);
    if (!evaluator) {
        return evaluator.error();
    }
    session->evaluator_ = std::move(*evaluator);
    session->evaluator_->setRecordCallback(session->options_.on_record);
    session->evaluator_->setPhaseCallback(session->options_.on_phase);
    session->resumed_ = session->evaluator_->seed(resumed);

    OptimizationContext optimization;
    optimization.space = &session->space_;
    optimization.evaluator = session->evaluator_.get();
    optimization.config = s.optimizerConfig();
    optimization.transcript = session->transcript_;

    auto optimizer =
        session->options_.registry.createOptimization(s.optimization_strategy, optimization);
    if (!optimizer) {
        return optimizer.error();
    }
    session->optimizer_ = std::move(*optimizer);
    session->optimizer_->setDirection(s.direction);
    session->optimizer_->setProgressCallback(session->options_.on_progress);

    spdlog::debug("Session ready: {} configurations, {} resumed", session->space_.count(),
                  session->resumed_);
    return std::move(session);
}

// =============================================================================
// Transcript Output
// =============================================================================

void TuningSession::printIntroduction() const {
    auto& t = *transcript_;
    const auto& s = settings_;

    t.info("");
    t.info(centered("Flamingo Autotuning System"));
    t.info(centered(fmt::format("v{}", Version::string())));
    t.info("");
    t.info("Retrieved settings:");
    t.info("");
    t.info(fmt::format("Variables:\n{}", s.variables));
    t.info("");
    t.info("Displayed as a tree:\n");
    t.info(space_.tree().render());

    std::vector<std::string> lines;
    for (const auto& name : space_.flatten()) {
        lines.push_back(
            fmt::format("{} = {}", name, fmt::join(space_.tree().find(name)->domain, ", ")));
    }
    t.info(fmt::format("Possible values:\n{}", fmt::join(lines, "\n")));
    t.info("");

    const std::pair<const char*, const std::string*> commands[] = {
        {"compile", &s.compile}, {"test", &s.test}, {"clean", &s.clean}};
    for (const auto& [label, command] : commands) {
        if (!command->empty()) {
            t.info(fmt::format("{}:\n{}\n", label, *command));
        }
    }

    if (s.repeat > 1) {
        t.info(fmt::format("(with {} repetitions each, aggregated by {})", s.repeat,
                           aggregatorName(s.aggregator)));
    }
    if (resumed_ > 0) {
        t.info(fmt::format("Resuming from '{}'", s.resume_path.value_or("")));
    }
    t.info("");
}

void TuningSession::printResults(const SessionResult& result) const {
    auto& t = *transcript_;
    const std::string word = optimalWord(settings_.direction);

    t.info("");
    t.info(fmt::format("{} valuation:", word));
    t.info(result.best->valuation.toString(", "));
    t.info(fmt::format("{} Score:", word));
    t.info(fmt::format("{}", *result.best->aggregate_score));
    t.info(fmt::format("The system ran {} tests, taking {}.", result.tests_run,
                       formatDuration(result.search_seconds)));
    if (result.resumed > 0) {
        t.info(fmt::format("({} more were taken from the resumed log)", result.resumed));
    }

    if (result.importance) {
        std::string timing =
            result.importance_tests_run > 0
                ? fmt::format(", taking {}", formatDuration(result.importance_seconds))
                : std::string();
        t.info(fmt::format("(and {} additional tests{})", result.importance_tests_run, timing));
        t.info("");
        t.info("Parameter importance around the optimum:");
        t.info(result.importance->toString());
    }
}

void TuningSession::printFailures() const {
    auto failures = evaluator_->log().failures();
    if (failures.empty()) {
        return;
    }
    auto& t = *transcript_;
    t.info("");
    t.info("FAILURES:");
    for (const auto& record : failures) {
        t.info(fmt::format("    Test {}: {}", record.id, record.failure_reason));
        t.info(fmt::format("    {}", record.valuation.toString(", ")));
        t.info("");
    }
}

void TuningSession::printOutputs(const SessionResult& result) const {
    auto& t = *transcript_;
    const auto& s = settings_;

    if (log_writer_) {
        bool partial = result.state == OptimizerState::kCancelled;
        t.info(fmt::format("A {}testing log was saved to '{}'", partial ? "partial " : "",
                           log_writer_->path()));
    }
    if (importance_writer_ && importance_evaluator_ && !importance_evaluator_->log().empty()) {
        t.info(fmt::format("Additional data was saved to '{}'", importance_writer_->path()));
    }
    if (s.script_path) {
        if (script_failed_) {
            t.info("Failed to write a script file.");
        } else if (!options_.transcript) {
            t.info(fmt::format("A testing transcript was written to '{}'", *s.script_path));
        }
    }
}

// =============================================================================
// Run
// =============================================================================

Result<void> TuningSession::runImportance(const Valuation& optimum, const CancellationToken& token,
                                          SessionResult& result) {
    EvaluationContext evaluation;
    evaluation.config = settings_.evaluatorConfig();
    evaluation.config.first_test_id = evaluator_->log().nextTestId();
    evaluation.runner = runner_;
    evaluation.transcript = transcript_;
    evaluation.reuse_from = &evaluator_->log();
    evaluation.log_writer = importance_writer_;

    auto sweep = options_.registry.createEvaluation(settings_.evaluation_strategy, evaluation);
    if (!sweep) {
        return sweep.error();
    }
    importance_evaluator_ = std::move(*sweep);
    importance_evaluator_->setRecordCallback(options_.on_record);
    importance_evaluator_->setPhaseCallback(options_.on_phase);

    auto start = Clock::now();
    auto report = optimizer_->runImportance(optimum, *importance_evaluator_, token);
    result.importance_seconds = secondsSince(start);
    if (!report) {
        return report.error();
    }

    result.importance_tests_run = importance_evaluator_->testsRun();
    result.importance = std::move(*report);
    if (result.importance->cancelled) {
        result.state = OptimizerState::kCancelled;
    }
    return {};
}

Result<SessionResult> TuningSession::run(const CancellationToken& token) {
    SessionResult result;
    result.tests_required = optimizer_->testsRequired();
    result.resumed = resumed_;

    printIntroduction();

    auto start = Clock::now();
    result.state = optimizer_->run(token);
    result.search_seconds = secondsSince(start);

    result.best = optimizer_->best();
    result.tests_logged = evaluator_->log().size();
    result.tests_run = evaluator_->testsRun();
    result.failures = evaluator_->log().numFailures();

    auto& t = *transcript_;
    switch (result.state) {
    case OptimizerState::kSucceeded:
        if (settings_.importance_path && result.best) {
            FLAMINGO_TRY(runImportance(result.best->valuation, token, result));
        }
        printResults(result);
        break;
    case OptimizerState::kInsufficientResults:
        t.info("");
        t.info("Not enough evaluations could be performed.");
        t.info("There were too many failures.");
        break;
    case OptimizerState::kCancelled:
    default:
        break;
    }

    printFailures();

    if (result.state == OptimizerState::kCancelled) {
        t.info("");
        t.info("Quitting Tuner");
        t.info(fmt::format("The run was cancelled after {} of {} tests.", result.tests_logged,
                           result.tests_required));
        if (settings_.log_path) {
            t.info(fmt::format("To resume, set \"resume\": \"{}\" in the \"execution\" settings "
                               "and choose a new log file.",
                               *settings_.log_path));
        }
    }

    printOutputs(result);

    if (settings_.summary_path) {
        std::ofstream out(*settings_.summary_path, std::ios::trunc);
        out << sessionSummaryJson(result, settings_) << '\n';
        if (!out) {
            spdlog::warn("Failed to write the summary to '{}'", *settings_.summary_path);
        } else {
            t.info(fmt::format("A summary was saved to '{}'", *settings_.summary_path));
        }
    }

    spdlog::info("Tuning finished: {}", optimizerStateName(result.state));
    return result;
}

}  // namespace tuner
}  // namespace flamingo
