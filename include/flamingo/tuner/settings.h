#pragma once

// =============================================================================
// Flamingo - Tuning Settings
// =============================================================================
//
// The typed settings record a configuration loader hands to the tuner, and a
// JSON loader for it. The JSON layout mirrors the sections of a classic
// tuner configuration:
//
//   {
//     "variables": "threads, blocks[threads=64]",
//     "values":    { "threads": [32, 64], "blocks": "16, 32" },
//     "testing":   { "compile": "...", "test": "...", "clean": "..." },
//     "scoring":   { "optimal": "min_time", "repeat": "3, med" },
//     "output":    { "log": "results.csv", "importance": "...",
//                    "script": "...", "summary": "..." },
//     "execution": { "parallelism": 1, "resume": "...", ... }
//   }
//
// Relative paths are resolved against the directory of the settings file,
// which is also the default working directory of the commands.
//

#include "flamingo/error.h"
#include "flamingo/tuner/evaluator.h"
#include "flamingo/tuner/optimizer.h"
#include "flamingo/tuner/scoring.h"
#include "flamingo/tuner/variable_tree.h"

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>

namespace flamingo {
namespace tuner {

struct TuningSettings {
    // Search space
    std::string variables;  // Tree declaration
    DomainMap values;

    // Commands
    std::string compile;
    std::string test;
    std::string clean;

    // Scoring
    Direction direction = Direction::kMinimize;
    bool custom_fom = false;  // No "optimal" option means minimise the running time
    size_t repeat = 1;
    Aggregator aggregator = Aggregator::kMin;

    // Output
    std::optional<std::string> log_path;
    std::optional<std::string> importance_path;
    std::optional<std::string> script_path;
    std::optional<std::string> summary_path;

    // Execution
    std::optional<std::string> resume_path;
    size_t parallelism = 1;
    double command_timeout_seconds = 0.0;
    double cancel_grace_seconds = 10.0;
    double max_failure_rate = 1.0;
    std::string working_directory;
    std::string log_level = "info";
    std::string evaluation_strategy = "process";
    std::string optimization_strategy = "exhaustive";

    /// All configuration errors, reported together
    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] EvaluatorConfig evaluatorConfig() const;
    [[nodiscard]] OptimizerConfig optimizerConfig() const;
};

struct OptimalSetting {
    Direction direction = Direction::kMinimize;
    bool custom_fom = false;
};

/// "min", "max", "min_time" or "max_time" (case-insensitive)
[[nodiscard]] Result<OptimalSetting> parseOptimal(std::string_view text);

struct RepeatSetting {
    size_t repeat = 1;
    Aggregator aggregator = Aggregator::kMin;
};

/// "N" or "N, <aggregator>"
[[nodiscard]] Result<RepeatSetting> parseRepeat(std::string_view text);

/// trace, debug, info, warn, error, critical, off
[[nodiscard]] Result<spdlog::level::level_enum> parseLogLevel(std::string_view text);

/// Parse JSON settings; relative paths are resolved against base_directory
[[nodiscard]] Result<TuningSettings> parseSettingsJson(std::string_view text,
                                                       const std::string& base_directory = "");

/// Load a JSON settings file
[[nodiscard]] Result<TuningSettings> loadSettingsFile(const std::string& path);

}  // namespace tuner
}  // namespace flamingo
