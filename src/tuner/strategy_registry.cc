// =============================================================================
// Flamingo - Strategy Registry Implementation
// =============================================================================

#include "flamingo/tuner/strategy_registry.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace flamingo {
namespace tuner {

namespace {

Result<std::unique_ptr<EvaluationStrategy>> makeProcessEvaluator(
    const EvaluationContext& context) {
    FLAMINGO_TRY(validateEvaluatorConfig(context.config));

    auto runner = context.runner ? context.runner : std::make_shared<ShellCommandRunner>();
    auto evaluator = std::make_unique<Evaluator>(context.config, std::move(runner),
                                                 context.transcript);
    evaluator->setReuseSource(context.reuse_from);
    evaluator->setLogWriter(context.log_writer);
    return std::unique_ptr<EvaluationStrategy>(std::move(evaluator));
}

Result<std::unique_ptr<OptimizationStrategy>> makeExhaustiveOptimizer(
    const OptimizationContext& context) {
    if (context.space == nullptr || context.evaluator == nullptr) {
        return Error(ErrorCode::kInvalidInput,
                     "the exhaustive optimizer needs a configuration space and an evaluator");
    }
    if (context.config.max_failure_rate <= 0.0 || context.config.max_failure_rate > 1.0) {
        return Error(ErrorCode::kConfigurationError,
                     fmt::format("the failure rate limit must be in (0, 1], got {}",
                                 context.config.max_failure_rate));
    }
    return std::unique_ptr<OptimizationStrategy>(std::make_unique<Optimizer>(
        *context.space, *context.evaluator, context.config, context.transcript));
}

template <typename Map>
std::vector<std::string> namesOf(const Map& entries) {
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& [name, entry] : entries) {
        names.push_back(name);
    }
    return names;
}

}  // namespace

StrategyRegistry StrategyRegistry::withBuiltins() {
    StrategyRegistry registry;
    registry.evaluations_.emplace(
        kProcessEvaluation,
        Entry<EvaluationFactory>{"Runs the compile, test and clean commands as shell processes",
                                 makeProcessEvaluator});
    registry.optimizations_.emplace(
        kExhaustiveOptimization,
        Entry<OptimizationFactory>{"Tests every configuration of the search space once",
                                   makeExhaustiveOptimizer});
    return registry;
}

Result<void> StrategyRegistry::registerEvaluation(const std::string& name, std::string description,
                                                  EvaluationFactory factory) {
    if (name.empty() || !factory) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kInvalidInput,
                              "an evaluation strategy needs a name and a factory");
    }
    if (!evaluations_.emplace(name, Entry<EvaluationFactory>{std::move(description),
                                                             std::move(factory)})
             .second) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kAlreadyExists,
                              fmt::format("evaluation strategy '{}' is already registered", name));
    }
    spdlog::debug("Registered evaluation strategy '{}'", name);
    FLAMINGO_RETURN_OK();
}

Result<void> StrategyRegistry::registerOptimization(const std::string& name,
                                                    std::string description,
                                                    OptimizationFactory factory) {
    if (name.empty() || !factory) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kInvalidInput,
                              "an optimization strategy needs a name and a factory");
    }
    if (!optimizations_.emplace(name, Entry<OptimizationFactory>{std::move(description),
                                                                 std::move(factory)})
             .second) {
        FLAMINGO_RETURN_ERROR(
            ErrorCode::kAlreadyExists,
            fmt::format("optimization strategy '{}' is already registered", name));
    }
    spdlog::debug("Registered optimization strategy '{}'", name);
    FLAMINGO_RETURN_OK();
}

Result<std::unique_ptr<EvaluationStrategy>> StrategyRegistry::createEvaluation(
    const std::string& name, const EvaluationContext& context) const {
    auto it = evaluations_.find(name);
    if (it == evaluations_.end()) {
        return Error(ErrorCode::kNotFound,
                     fmt::format("unknown evaluation strategy '{}' (available: {})", name,
                                 fmt::join(evaluationNames(), ", ")));
    }
    return it->second.factory(context);
}

Result<std::unique_ptr<OptimizationStrategy>> StrategyRegistry::createOptimization(
    const std::string& name, const OptimizationContext& context) const {
    auto it = optimizations_.find(name);
    if (it == optimizations_.end()) {
        return Error(ErrorCode::kNotFound,
                     fmt::format("unknown optimization strategy '{}' (available: {})", name,
                                 fmt::join(optimizationNames(), ", ")));
    }
    return it->second.factory(context);
}

std::vector<std::string> StrategyRegistry::evaluationNames() const {
    return namesOf(evaluations_);
}

std::vector<std::string> StrategyRegistry::optimizationNames() const {
    return namesOf(optimizations_);
}

std::string StrategyRegistry::describe(const std::string& name) const {
    if (auto it = evaluations_.find(name); it != evaluations_.end()) {
        return it->second.description;
    }
    if (auto it = optimizations_.find(name); it != optimizations_.end()) {
        return it->second.description;
    }
    return {};
}

}  // namespace tuner
}  // namespace flamingo
