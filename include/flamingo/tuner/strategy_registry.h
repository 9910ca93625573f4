#pragma once

// =============================================================================
// Flamingo - Strategy Registry
// =============================================================================
//
// Typed factories for evaluation and optimization strategies, keyed by name
// and resolved once when a session starts. Built-ins:
//
//   evaluation:   "process"     - runs the external compile/test/clean commands
//   optimization: "exhaustive"  - tests every valuation of the space
//
// Additional strategies are registered by the embedding program before the
// session is created.
//

#include "flamingo/error.h"
#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/evaluator.h"
#include "flamingo/tuner/optimizer.h"

#include <spdlog/logger.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace flamingo {
namespace tuner {

inline constexpr const char* kProcessEvaluation = "process";
inline constexpr const char* kExhaustiveOptimization = "exhaustive";

struct EvaluationContext {
    EvaluatorConfig config;
    std::shared_ptr<CommandRunner> runner;
    std::shared_ptr<spdlog::logger> transcript;
    const ResultLog* reuse_from = nullptr;          // Optional
    std::shared_ptr<ResultLogWriter> log_writer;  // Optional
};

struct OptimizationContext {
    const ConfigurationSpace* space = nullptr;
    EvaluationStrategy* evaluator = nullptr;
    OptimizerConfig config;
    std::shared_ptr<spdlog::logger> transcript;
};

using EvaluationFactory =
    std::function<Result<std::unique_ptr<EvaluationStrategy>>(const EvaluationContext&)>;
using OptimizationFactory =
    std::function<Result<std::unique_ptr<OptimizationStrategy>>(const OptimizationContext&)>;

class StrategyRegistry {
  public:
    StrategyRegistry() = default;

    /// Registry with the built-in strategies
    [[nodiscard]] static StrategyRegistry withBuiltins();

    [[nodiscard]] Result<void> registerEvaluation(const std::string& name,
                                                  std::string description,
                                                  EvaluationFactory factory);
    [[nodiscard]] Result<void> registerOptimization(const std::string& name,
                                                    std::string description,
                                                    OptimizationFactory factory);

    [[nodiscard]] Result<std::unique_ptr<EvaluationStrategy>> createEvaluation(
        const std::string& name, const EvaluationContext& context) const;
    [[nodiscard]] Result<std::unique_ptr<OptimizationStrategy>> createOptimization(
        const std::string& name, const OptimizationContext& context) const;

    [[nodiscard]] bool hasEvaluation(const std::string& name) const {
        return evaluations_.count(name) > 0;
    }
    [[nodiscard]] bool hasOptimization(const std::string& name) const {
        return optimizations_.count(name) > 0;
    }

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> evaluationNames() const;
    [[nodiscard]] std::vector<std::string> optimizationNames() const;

    [[nodiscard]] std::string describe(const std::string& name) const;

  private:
    template <typename Factory>
    struct Entry {
        std::string description;
        Factory factory;
    };

    std::map<std::string, Entry<EvaluationFactory>> evaluations_;
    std::map<std::string, Entry<OptimizationFactory>> optimizations_;
};

}  // namespace tuner
}  // namespace flamingo
