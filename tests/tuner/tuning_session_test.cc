// =============================================================================
// Flamingo - Tuning Session Tests
// =============================================================================

#include "flamingo/tuner/tuning_session.h"

#include "fake_command_runner.h"
#include "flamingo/transcript.h"
#include "temp_dir.h"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <sstream>

namespace flamingo {
namespace tuner {
namespace {

using test_support::FakeCommandRunner;
using test_support::readFile;
using test_support::TempDir;
using test_support::words;
using test_support::writeFile;

// "test <threads> <blocks>" prints threads / blocks
Result<CommandResult> ratioTest(const std::string& command) {
    auto w = words(command);
    if (w.size() < 3 || w[0] != "test") {
        return FakeCommandRunner::exitWith(0);
    }
    double blocks = w[2] == "%blocks%" ? 1.0 : std::stod(w[2]);
    return FakeCommandRunner::printScore(std::stod(w[1]) / blocks);
}

class TuningSessionTest : public ::testing::Test {
  protected:
    TuningSettings baseSettings() const {
        TuningSettings settings;
        settings.variables = "threads, blocks";
        settings.values = {{"threads", {"32", "64"}}, {"blocks", {"16", "32"}}};
        settings.test = "test %threads% %blocks%";
        settings.custom_fom = true;
        settings.repeat = 3;
        settings.aggregator = Aggregator::kMin;
        return settings;
    }

    SessionOptions options(FakeCommandRunner::Handler handler = ratioTest) {
        runner_ = std::make_shared<FakeCommandRunner>(std::move(handler));
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(transcript_text_);
        auto transcript = std::make_shared<spdlog::logger>("session_test", sink);
        transcript->set_pattern("%v");

        SessionOptions options;
        options.runner = runner_;
        options.transcript = transcript;
        return options;
    }

    std::string transcript() const { return transcript_text_.str(); }

    std::shared_ptr<FakeCommandRunner> runner_;
    std::ostringstream transcript_text_;
    CancellationToken token_;
};

TEST_F(TuningSessionTest, EndToEnd) {
    auto session = TuningSession::create(baseSettings(), options());
    ASSERT_TRUE(session) << session.error().toString();
    EXPECT_EQ((*session)->space().count(), 4u);

    auto result = (*session)->run(token_);
    ASSERT_TRUE(result) << result.error().toString();

    EXPECT_EQ(result->state, OptimizerState::kSucceeded);
    EXPECT_EQ(result->tests_required, 4u);
    EXPECT_EQ(result->tests_run, 4u);
    EXPECT_EQ(result->failures, 0u);
    ASSERT_TRUE(result->best);
    EXPECT_EQ(result->best->valuation, (Valuation{{"threads", "32"}, {"blocks", "32"}}));
    EXPECT_DOUBLE_EQ(*result->best->aggregate_score, 1.0);
    EXPECT_FALSE(result->importance);

    auto text = transcript();
    EXPECT_NE(text.find("Number of tests to be run: 4"), std::string::npos);
    EXPECT_NE(text.find("(with 3 repetitions each"), std::string::npos);
    EXPECT_NE(text.find("Minimal valuation:"), std::string::npos);
    EXPECT_NE(text.find("blocks = 32, threads = 32"), std::string::npos);
    EXPECT_NE(text.find("The system ran 4 tests"), std::string::npos);
}

TEST_F(TuningSessionTest, ConditionalSpaceCount) {
    auto settings = baseSettings();
    settings.variables = "threads, blocks[threads=64]";
    settings.repeat = 1;

    auto session = TuningSession::create(settings, options());
    ASSERT_TRUE(session) << session.error().toString();
    EXPECT_EQ((*session)->optimizer().testsRequired(), 3u);

    auto result = (*session)->run(token_);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->tests_run, 3u);
}

TEST_F(TuningSessionTest, AllFailuresAreReported) {
    auto session = TuningSession::create(baseSettings(), options([](const std::string&) {
        return FakeCommandRunner::exitWith(0, "no number here\n");
    }));
    ASSERT_TRUE(session);

    auto result = (*session)->run(token_);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, OptimizerState::kInsufficientResults);
    EXPECT_EQ(result->failures, result->tests_required);
    EXPECT_FALSE(result->best);

    auto text = transcript();
    EXPECT_NE(text.find("Not enough evaluations could be performed."), std::string::npos);
    EXPECT_NE(text.find("FAILURES:"), std::string::npos);
}

TEST_F(TuningSessionTest, InvalidSettingsAreRejectedBeforeRunning) {
    auto settings = baseSettings();
    settings.variables = "threads, blocks[threads=128]";

    auto session = TuningSession::create(settings, options());
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().code(), ErrorCode::kConfigurationError);
    EXPECT_TRUE(runner_->commands().empty());
}

TEST_F(TuningSessionTest, UnknownStrategy) {
    auto settings = baseSettings();
    settings.optimization_strategy = "genetic";

    auto session = TuningSession::create(settings, options());
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().code(), ErrorCode::kNotFound);
}

TEST_F(TuningSessionTest, WritesLogAndResumes) {
    TempDir dir;
    auto settings = baseSettings();
    settings.log_path = dir.file("first.csv");

    {
        auto session = TuningSession::create(settings, options());
        ASSERT_TRUE(session) << session.error().toString();
        auto result = (*session)->run(token_);
        ASSERT_TRUE(result);
        EXPECT_EQ(result->tests_run, 4u);
    }
    EXPECT_NE(transcript().find("A testing log was saved to"), std::string::npos);

    std::string first_log = readFile(dir.file("first.csv"));
    const std::string header =
        "TestNo,threads,blocks,Score_1,Score_2,Score_3,Score_Overall,Outcome\n";
    EXPECT_EQ(first_log.rfind(header, 0), 0u);

    // Resume into a new log: nothing is re-run and the same optimum is found
    settings.resume_path = dir.file("first.csv");
    settings.log_path = dir.file("second.csv");
    auto session = TuningSession::create(settings, options());
    ASSERT_TRUE(session) << session.error().toString();

    auto result = (*session)->run(token_);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->resumed, 4u);
    EXPECT_EQ(result->tests_run, 0u);
    EXPECT_TRUE(runner_->commands().empty());
    ASSERT_TRUE(result->best);
    EXPECT_EQ(result->best->valuation, (Valuation{{"threads", "32"}, {"blocks", "32"}}));

    // The new log carries the resumed records
    EXPECT_EQ(readFile(dir.file("second.csv")), first_log);
}

TEST_F(TuningSessionTest, ResumeFromPartialLog) {
    TempDir dir;
    writeFile(dir.file("partial.csv"),
              "TestNo,threads,blocks,Score_1,Score_Overall,Outcome\n"
              "1,32,16,2,2,ok\n"
              "2,32,32,compile,,\n");  // Malformed row, skipped

    auto settings = baseSettings();
    settings.repeat = 1;
    settings.resume_path = dir.file("partial.csv");

    auto session = TuningSession::create(settings, options());
    ASSERT_TRUE(session) << session.error().toString();
    auto result = (*session)->run(token_);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->resumed, 1u);
    EXPECT_EQ(result->tests_run, 3u);
    EXPECT_EQ(result->tests_logged, 4u);

    // New ids continue after the resumed ones
    for (const auto& record : (*session)->evaluator().log().snapshot()) {
        if (record.valuation != Valuation{{"threads", "32"}, {"blocks", "16"}}) {
            EXPECT_GE(record.id, 2u);
        }
    }
}

TEST_F(TuningSessionTest, ResumeWithOtherVariablesFails) {
    TempDir dir;
    writeFile(dir.file("other.csv"), "TestNo,unroll,Score_1,Score_Overall,Outcome\n");

    auto settings = baseSettings();
    settings.resume_path = dir.file("other.csv");
    auto session = TuningSession::create(settings, options());
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().code(), ErrorCode::kConfigurationError);
}

TEST_F(TuningSessionTest, ImportanceSweep) {
    TempDir dir;
    auto settings = baseSettings();
    settings.repeat = 1;
    settings.log_path = dir.file("log.csv");
    settings.importance_path = dir.file("importance.csv");

    auto session = TuningSession::create(settings, options());
    ASSERT_TRUE(session) << session.error().toString();
    auto result = (*session)->run(token_);
    ASSERT_TRUE(result);

    ASSERT_EQ(result->state, OptimizerState::kSucceeded);
    ASSERT_TRUE(result->importance);
    // Every one-variable change of the optimum was already tested
    EXPECT_EQ(result->importance->candidates, 3u);
    EXPECT_EQ(result->importance_tests_run, 0u);
    EXPECT_EQ(runner_->count("test"), 4u);
    ASSERT_NE((*session)->importanceEvaluator(), nullptr);
    EXPECT_EQ((*session)->importanceEvaluator()->log().size(), 3u);

    auto text = transcript();
    EXPECT_NE(text.find("Additional tests to check parameter importance:"), std::string::npos);
    EXPECT_NE(text.find("(None required)"), std::string::npos);
    EXPECT_NE(text.find("Additional data was saved to"), std::string::npos);

    auto importance_log = readFile(dir.file("importance.csv"));
    EXPECT_EQ(std::count(importance_log.begin(), importance_log.end(), '\n'), 4);
}

TEST_F(TuningSessionTest, CancelledRun) {
    TempDir dir;
    CancellationToken token;
    int calls = 0;
    auto settings = baseSettings();
    settings.repeat = 1;
    settings.log_path = dir.file("log.csv");

    auto session = TuningSession::create(settings, options([&](const std::string& command) {
        if (++calls == 2) {
            token.cancel();
        }
        return ratioTest(command);
    }));
    ASSERT_TRUE(session);

    auto result = (*session)->run(token);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, OptimizerState::kCancelled);
    EXPECT_EQ(result->tests_logged, 2u);

    auto text = transcript();
    EXPECT_NE(text.find("Quitting Tuner"), std::string::npos);
    EXPECT_NE(text.find("A partial testing log was saved to"), std::string::npos);
}

TEST_F(TuningSessionTest, SummaryJson) {
    TempDir dir;
    auto settings = baseSettings();
    settings.summary_path = dir.file("summary.json");

    auto session = TuningSession::create(settings, options());
    ASSERT_TRUE(session);
    auto result = (*session)->run(token_);
    ASSERT_TRUE(result);

    auto summary = nlohmann::json::parse(readFile(dir.file("summary.json")));
    EXPECT_EQ(summary["state"], "succeeded");
    EXPECT_EQ(summary["direction"], "min");
    EXPECT_EQ(summary["tests_required"], 4);
    EXPECT_EQ(summary["best"]["valuation"]["threads"], "32");
    EXPECT_EQ(summary["best"]["valuation"]["blocks"], "32");
    EXPECT_DOUBLE_EQ(summary["best"]["score"].get<double>(), 1.0);
    EXPECT_FALSE(summary.contains("importance"));
}

TEST_F(TuningSessionTest, UnwritableLogIsAConfigurationProblem) {
    auto settings = baseSettings();
    settings.log_path = "/nonexistent/flamingo/log.csv";

    auto session = TuningSession::create(settings, options());
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().code(), ErrorCode::kIoError);
}

}  // namespace
}  // namespace tuner
}  // namespace flamingo
