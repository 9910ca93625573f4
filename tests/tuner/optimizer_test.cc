// =============================================================================
// Flamingo - Optimizer Tests
// =============================================================================

#include "flamingo/tuner/optimizer.h"

#include "fake_command_runner.h"
#include "flamingo/transcript.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace flamingo {
namespace tuner {
namespace {

using test_support::FakeCommandRunner;
using test_support::words;

// "test <threads> [blocks]" prints threads / blocks
Result<CommandResult> ratioTest(const std::string& command) {
    auto w = words(command);
    double threads = std::stod(w[1]);
    double blocks = w.size() > 2 && w[2] != "%blocks%" ? std::stod(w[2]) : 1.0;
    return FakeCommandRunner::printScore(threads / blocks);
}

class OptimizerTest : public ::testing::Test {
  protected:
    void build(const std::string& declaration, const DomainMap& domains,
               FakeCommandRunner::Handler handler, size_t repeat = 1,
               Aggregator aggregator = Aggregator::kMin) {
        auto tree = VariableTree::parse(declaration, domains);
        ASSERT_TRUE(tree) << tree.error().toString();
        auto space = ConfigurationSpace::create(std::move(*tree));
        ASSERT_TRUE(space) << space.error().toString();
        space_ = std::move(*space);

        config_.test = CommandTemplate("test %threads% %blocks%");
        config_.repeat = repeat;
        config_.aggregator = aggregator;
        runner_ = std::make_shared<FakeCommandRunner>(std::move(handler));
        evaluator_ = std::make_unique<Evaluator>(config_, runner_,
                                                 makeSilentTranscript("optimizer_test"));
    }

    std::unique_ptr<Optimizer> makeOptimizer(OptimizerConfig config = {}) {
        return std::make_unique<Optimizer>(space_, *evaluator_, config,
                                           makeSilentTranscript("optimizer_test"));
    }

    static DomainMap threadsBlocks() {
        return {
            {"threads", {"32", "64"}},
            {"blocks", {"16", "32"}},
        };
    }

    ConfigurationSpace space_;
    EvaluatorConfig config_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::unique_ptr<Evaluator> evaluator_;
    CancellationToken token_;
};

TEST_F(OptimizerTest, FindsMinimalRatio) {
    build("threads, blocks", threadsBlocks(), ratioTest, 3, Aggregator::kMin);
    auto optimizer = makeOptimizer();

    EXPECT_EQ(optimizer->state(), OptimizerState::kIdle);
    EXPECT_EQ(optimizer->testsRequired(), 4u);
    EXPECT_EQ(optimizer->testsRemaining(), 4u);

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(optimizer->state(), OptimizerState::kSucceeded);

    auto best = optimizer->bestValuation();
    ASSERT_TRUE(best);
    EXPECT_EQ(*best, (Valuation{{"threads", "32"}, {"blocks", "32"}}));
    EXPECT_DOUBLE_EQ(*optimizer->bestScore(), 1.0);

    EXPECT_EQ(optimizer->numTests(), 4u);
    EXPECT_EQ(optimizer->testsRemaining(), 0u);
    EXPECT_TRUE(optimizer->failures().empty());
    EXPECT_EQ(runner_->count("test"), 12u);
}

TEST_F(OptimizerTest, FindsMaximalRatio) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();
    optimizer->setDirection(Direction::kMaximize);

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(*optimizer->bestValuation(), (Valuation{{"threads", "64"}, {"blocks", "16"}}));
    EXPECT_DOUBLE_EQ(*optimizer->bestScore(), 4.0);
    EXPECT_EQ(optimizer->direction(), Direction::kMaximize);
}

TEST_F(OptimizerTest, ConditionalSpace) {
    build("threads, blocks[threads=64]", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();

    EXPECT_EQ(optimizer->testsRequired(), 3u);
    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(optimizer->numTests(), 3u);
    EXPECT_EQ(runner_->count("test 32 %blocks%"), 1u);

    // 64 / 32 = 2 beats 32 / 1
    EXPECT_EQ(*optimizer->bestValuation(), (Valuation{{"threads", "64"}, {"blocks", "32"}}));
}

TEST_F(OptimizerTest, TiesGoToTheEarlierTest) {
    build("threads, blocks", threadsBlocks(),
          [](const std::string&) { return FakeCommandRunner::printScore(1.0); });
    auto optimizer = makeOptimizer();

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    auto best = optimizer->best();
    ASSERT_TRUE(best);
    EXPECT_EQ(best->id, 1u);
    EXPECT_EQ(best->valuation, (Valuation{{"threads", "32"}, {"blocks", "16"}}));
}

TEST_F(OptimizerTest, AllFailuresAreInsufficient) {
    build("threads, blocks", threadsBlocks(),
          [](const std::string&) { return FakeCommandRunner::exitWith(0, "n/a\n"); });
    auto optimizer = makeOptimizer();

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kInsufficientResults);
    EXPECT_EQ(optimizer->failures().size(), optimizer->testsRequired());
    EXPECT_FALSE(optimizer->best());
    EXPECT_FALSE(optimizer->bestScore());
}

TEST_F(OptimizerTest, FailureRateLimit) {
    // Only threads=64 blocks=32 works: one success out of four
    build("threads, blocks", threadsBlocks(), [](const std::string& command) {
        if (command == "test 64 32") {
            return FakeCommandRunner::printScore(2.0);
        }
        return FakeCommandRunner::exitWith(1);
    });

    OptimizerConfig config;
    config.max_failure_rate = 0.5;
    auto optimizer = makeOptimizer(config);

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kInsufficientResults);
    // The best result is still reported
    ASSERT_TRUE(optimizer->best());
    EXPECT_DOUBLE_EQ(*optimizer->bestScore(), 2.0);
}

TEST_F(OptimizerTest, SomeFailuresStillSucceed) {
    build("threads, blocks", threadsBlocks(), [](const std::string& command) {
        if (command == "test 64 32") {
            return FakeCommandRunner::exitWith(1);
        }
        return FakeCommandRunner::printScore(3.0);
    });
    auto optimizer = makeOptimizer();

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(optimizer->failures().size(), 1u);
}

TEST_F(OptimizerTest, ResumedRunExecutesNothing) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    std::vector<TestRecord> previous;
    TestId id = 1;
    for (const auto& valuation : space_.enumerateAll()) {
        double threads = std::stod(*valuation.find("threads"));
        double blocks = std::stod(*valuation.find("blocks"));
        previous.push_back(TestRecord::success(id++, valuation, {threads / blocks},
                                               threads / blocks));
    }
    EXPECT_EQ(evaluator_->seed(previous), 4u);

    auto optimizer = makeOptimizer();
    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(runner_->commands().size(), 0u);
    EXPECT_EQ(evaluator_->testsRun(), 0u);
    EXPECT_EQ(*optimizer->bestValuation(), (Valuation{{"threads", "32"}, {"blocks", "32"}}));
    EXPECT_EQ(optimizer->best()->id, 2u);
}

TEST_F(OptimizerTest, PartialResumeRunsTheRest) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    // A seeded record better than anything the test would produce
    evaluator_->seed({TestRecord::success(5, Valuation{{"threads", "64"}, {"blocks", "16"}},
                                          {0.5}, 0.5)});

    auto optimizer = makeOptimizer();
    std::vector<uint64_t> progress;
    optimizer->setProgressCallback(
        [&](uint64_t completed, uint64_t total) {
            EXPECT_EQ(total, 4u);
            progress.push_back(completed);
        });

    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(runner_->count("test"), 3u);
    EXPECT_EQ(progress, (std::vector<uint64_t>{2, 3, 4}));
    EXPECT_EQ(optimizer->best()->id, 5u);

    // New tests continue after the seeded id
    auto log = evaluator_->log().snapshot();
    TestId max_id = 0;
    for (const auto& record : log) {
        max_id = std::max(max_id, record.id);
    }
    EXPECT_EQ(max_id, 8u);
}

TEST_F(OptimizerTest, BestCallbackFiresOnImprovement) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();

    std::vector<double> improvements;
    optimizer->setBestCallback(
        [&](const TestRecord& record) { improvements.push_back(*record.aggregate_score); });
    ASSERT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);

    // Order: 32/16=2, 32/32=1, 64/16=4, 64/32=2
    EXPECT_EQ(improvements, (std::vector<double>{2.0, 1.0}));
}

TEST_F(OptimizerTest, CancellationStopsTheSearch) {
    CancellationToken token;
    int calls = 0;
    build("threads, blocks", threadsBlocks(), [&](const std::string& command) {
        if (++calls == 2) {
            token.cancel();
        }
        return ratioTest(command);
    });
    auto optimizer = makeOptimizer();

    EXPECT_EQ(optimizer->run(token), OptimizerState::kCancelled);
    // The in-flight test finishes and is kept
    EXPECT_EQ(optimizer->numTests(), 2u);
    EXPECT_LT(optimizer->numTests(), optimizer->testsRequired());
}

TEST_F(OptimizerTest, RunsOnlyOnce) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();
    ASSERT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    EXPECT_EQ(runner_->count("test"), 4u);
}

TEST_F(OptimizerTest, StateNames) {
    EXPECT_EQ(optimizerStateName(OptimizerState::kSucceeded), "succeeded");
    EXPECT_EQ(optimizerStateName(OptimizerState::kInsufficientResults), "insufficient_results");
    EXPECT_EQ(optimizerStateName(OptimizerState::kCancelled), "cancelled");
}

// -----------------------------------------------------------------------------
// Importance sweep
// -----------------------------------------------------------------------------

TEST_F(OptimizerTest, ImportanceCandidates) {
    build("threads, blocks[threads=64]", threadsBlocks(), ratioTest);

    auto candidates = Optimizer::importanceCandidates(
        space_, Valuation{{"threads", "64"}, {"blocks", "32"}});

    // threads: 32 (blocks dropped), 64 (the optimum); blocks: 16, 32 (the optimum again)
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0], (Valuation{{"threads", "32"}}));
    EXPECT_EQ(candidates[1], (Valuation{{"threads", "64"}, {"blocks", "32"}}));
    EXPECT_EQ(candidates[2], (Valuation{{"threads", "64"}, {"blocks", "16"}}));
    for (const auto& candidate : candidates) {
        EXPECT_TRUE(space_.contains(candidate));
    }
}

TEST_F(OptimizerTest, ImportanceReusesMainLog) {
    DomainMap domains = {
        {"threads", {"32", "64"}},
        {"blocks", {"16", "32"}},
        {"unroll", {"1", "2", "4"}},
    };
    build("threads, blocks", domains, ratioTest);
    auto optimizer = makeOptimizer();

    // Search only part of the space by seeding a log that covers two points
    evaluator_->seed({
        TestRecord::success(1, Valuation{{"threads", "32"}, {"blocks", "32"}}, {1.0}, 1.0),
        TestRecord::success(2, Valuation{{"threads", "32"}, {"blocks", "16"}}, {2.0}, 2.0),
    });
    ASSERT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    ASSERT_EQ(runner_->count("test"), 2u);

    auto sweep_config = config_;
    sweep_config.first_test_id = evaluator_->log().nextTestId();
    Evaluator sweep(sweep_config, runner_, makeSilentTranscript("optimizer_test"));
    sweep.setReuseSource(&evaluator_->log());

    auto report = optimizer->runImportance(*optimizer->bestValuation(), sweep, token_);
    ASSERT_TRUE(report) << report.error().toString();

    // Every candidate is already in the main log
    EXPECT_EQ(report->candidates, 3u);
    EXPECT_EQ(report->executed, 0u);
    EXPECT_EQ(sweep.testsRun(), 0u);
    EXPECT_EQ(runner_->count("test"), 2u);

    ASSERT_EQ(report->entries.size(), 2u);
    EXPECT_EQ(report->entries[0].variable, "threads");
    EXPECT_DOUBLE_EQ(report->entries[0].spread(), 1.0);  // 32/32=1 vs 64/32=2
    EXPECT_EQ(report->entries[1].variable, "blocks");
    EXPECT_DOUBLE_EQ(report->entries[1].spread(), 1.0);  // 32/16=2 vs 32/32=1
    EXPECT_FALSE(report->toString().empty());
}

TEST_F(OptimizerTest, ImportanceRunsMissingCandidates) {
    build("threads, blocks[threads=64]", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();
    // Only the optimum is known
    evaluator_->seed(
        {TestRecord::success(1, Valuation{{"threads", "64"}, {"blocks", "32"}}, {2.0}, 0.1)});
    ASSERT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);
    size_t before = runner_->count("test");

    Evaluator sweep(config_, runner_, makeSilentTranscript("optimizer_test"));
    sweep.setReuseSource(&evaluator_->log());
    auto report = optimizer->runImportance(*optimizer->bestValuation(), sweep, token_);
    ASSERT_TRUE(report);

    // The search already ran the other two points, nothing new is needed
    EXPECT_EQ(report->executed, 0u);
    EXPECT_EQ(runner_->count("test"), before);
    EXPECT_EQ(sweep.log().size(), 3u);
}

TEST_F(OptimizerTest, ImportanceExecutesOnFreshEvaluator) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();
    ASSERT_EQ(optimizer->run(token_), OptimizerState::kSucceeded);

    // Without a reuse source every distinct candidate runs
    Evaluator sweep(config_, runner_, makeSilentTranscript("optimizer_test"));
    auto report = optimizer->runImportance(*optimizer->bestValuation(), sweep, token_);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->candidates, 3u);
    EXPECT_EQ(report->executed, 3u);
    EXPECT_EQ(sweep.testsRun(), 3u);
}

TEST_F(OptimizerTest, ImportanceRejectsForeignOptimum) {
    build("threads, blocks", threadsBlocks(), ratioTest);
    auto optimizer = makeOptimizer();
    Evaluator sweep(config_, runner_, makeSilentTranscript("optimizer_test"));

    auto report = optimizer->runImportance(Valuation{{"threads", "48"}}, sweep, token_);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code(), ErrorCode::kInvalidInput);
}

}  // namespace
}  // namespace tuner
}  // namespace flamingo
