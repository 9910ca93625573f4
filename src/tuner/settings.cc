// =============================================================================
// Flamingo - Tuning Settings Implementation
// =============================================================================

#include "flamingo/tuner/settings.h"

#include "flamingo/string_util.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace flamingo {
namespace tuner {

namespace fs = std::filesystem;

// =============================================================================
// Option Parsing
// =============================================================================

Result<OptimalSetting> parseOptimal(std::string_view text) {
    auto lowered = toLower(trim(text));

    OptimalSetting setting;
    if (lowered == "min" || lowered == "min_time") {
        setting.direction = Direction::kMinimize;
    } else if (lowered == "max" || lowered == "max_time") {
        setting.direction = Direction::kMaximize;
    } else {
        return Error(ErrorCode::kConfigurationError,
                     fmt::format("invalid setting '{}' for 'optimal', expected one of: "
                                 "max_time, min_time, max, min",
                                 text));
    }
    // The "_time" variants measure the running time instead of reading a score
    setting.custom_fom = lowered.size() == 3;
    return setting;
}

Result<RepeatSetting> parseRepeat(std::string_view text) {
    RepeatSetting setting;

    size_t comma = text.find(',');
    std::string_view count = trim(text.substr(0, comma));
    auto repeat = parseUnsigned(count);
    if (!repeat || *repeat < 1) {
        return Error(ErrorCode::kConfigurationError,
                     fmt::format("invalid setting '{}' for 'repeat', the number of repetitions "
                                 "must be at least 1",
                                 text));
    }
    setting.repeat = static_cast<size_t>(*repeat);

    if (comma != std::string_view::npos) {
        auto aggregator = parseAggregator(text.substr(comma + 1));
        if (!aggregator) {
            return Error(ErrorCode::kConfigurationError,
                         fmt::format("invalid setting '{}' for 'repeat': {}", text,
                                     aggregator.error().message()));
        }
        setting.aggregator = *aggregator;
    }
    return setting;
}

Result<spdlog::level::level_enum> parseLogLevel(std::string_view text) {
    auto lowered = toLower(trim(text));
    if (lowered == "trace")
        return spdlog::level::trace;
    if (lowered == "debug")
        return spdlog::level::debug;
    if (lowered == "info")
        return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning")
        return spdlog::level::warn;
    if (lowered == "error")
        return spdlog::level::err;
    if (lowered == "critical")
        return spdlog::level::critical;
    if (lowered == "off")
        return spdlog::level::off;

    return Error(ErrorCode::kConfigurationError,
                 fmt::format("invalid log level '{}', expected one of: trace, debug, info, warn, "
                             "error, critical, off",
                             text));
}

// =============================================================================
// TuningSettings
// =============================================================================

Result<void> TuningSettings::validate() const {
    std::vector<std::string> problems;

    auto tree = VariableTree::parse(variables, values);
    if (!tree) {
        problems.emplace_back(tree.error().message());
    }

    auto evaluator = validateEvaluatorConfig(evaluatorConfig());
    if (!evaluator) {
        problems.emplace_back(evaluator.error().message());
    }

    if (!(max_failure_rate > 0.0 && max_failure_rate <= 1.0)) {
        problems.push_back(
            fmt::format("'max_failure_rate' must be in (0, 1], got {}", max_failure_rate));
    }

    auto level = parseLogLevel(log_level);
    if (!level) {
        problems.emplace_back(level.error().message());
    }

    if (evaluation_strategy.empty() || optimization_strategy.empty()) {
        problems.emplace_back("strategy names cannot be empty");
    }

    if (log_path && resume_path && fs::path(*log_path) == fs::path(*resume_path)) {
        problems.push_back(fmt::format(
            "the log '{}' cannot also be the log to resume from, it is rewritten at start",
            *log_path));
    }

    if (!problems.empty()) {
        FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError,
                              fmt::format("{}", fmt::join(problems, "; ")));
    }
    FLAMINGO_RETURN_OK();
}

EvaluatorConfig TuningSettings::evaluatorConfig() const {
    EvaluatorConfig config;
    config.compile = CommandTemplate(compile);
    config.test = CommandTemplate(test);
    config.clean = CommandTemplate(clean);
    config.repeat = repeat;
    config.aggregator = aggregator;
    config.custom_fom = custom_fom;
    config.command_timeout_seconds = command_timeout_seconds;
    config.cancel_grace_seconds = cancel_grace_seconds;
    config.working_directory = working_directory;
    config.parallelism = parallelism;
    return config;
}

OptimizerConfig TuningSettings::optimizerConfig() const {
    OptimizerConfig config;
    config.direction = direction;
    config.max_failure_rate = max_failure_rate;
    config.batch_size = parallelism;
    return config;
}

// =============================================================================
// JSON Loading
// =============================================================================

namespace {

using json = nlohmann::json;

std::string resolvePath(const std::string& base, const std::string& path) {
    if (base.empty() || path.empty() || fs::path(path).is_absolute()) {
        return path;
    }
    return (fs::path(base) / path).lexically_normal().string();
}

Result<const json*> section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return static_cast<const json*>(nullptr);
    }
    if (!it->is_object()) {
        return Error(ErrorCode::kSettingsParseError,
                     fmt::format("the section '{}' must be an object", name));
    }
    return &*it;
}

void warnUnknownKeys(const json& object, const char* where,
                     std::initializer_list<const char*> known) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        bool found = false;
        for (const char* key : known) {
            if (it.key() == key) {
                found = true;
                break;
            }
        }
        if (!found) {
            spdlog::warn("Unknown setting '{}' in {} is ignored", it.key(), where);
        }
    }
}

std::optional<std::string> optionalString(const json* object, const char* key) {
    if (object == nullptr) {
        return std::nullopt;
    }
    auto it = object->find(key);
    if (it == object->end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// A scalar value of a domain, numbers keep their JSON spelling
std::optional<std::string> scalarText(const json& value) {
    if (value.is_string()) {
        return std::string(trim(value.get<std::string>()));
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return std::nullopt;
}

Result<std::vector<std::string>> domainValues(const std::string& name, const json& value) {
    if (value.is_string()) {
        return splitTrimmed(value.get<std::string>(), ',');
    }

    std::vector<std::string> values;
    if (value.is_array()) {
        values.reserve(value.size());
        for (const auto& item : value) {
            auto text = scalarText(item);
            if (!text) {
                return Error(ErrorCode::kSettingsParseError,
                             fmt::format("the possible values of '{}' must be strings or numbers",
                                         name));
            }
            values.push_back(std::move(*text));
        }
        return values;
    }

    auto text = scalarText(value);
    if (!text) {
        return Error(ErrorCode::kSettingsParseError,
                     fmt::format("the possible values of '{}' must be a list or a string", name));
    }
    values.push_back(std::move(*text));
    return values;
}

}  // namespace

Result<TuningSettings> parseSettingsJson(std::string_view text, const std::string& base_directory) {
    TuningSettings settings;

    try {
        auto root = json::parse(text.begin(), text.end());
        if (!root.is_object()) {
            return Error(ErrorCode::kSettingsParseError, "the settings must be a JSON object");
        }
        warnUnknownKeys(root, "the settings",
                        {"variables", "values", "testing", "scoring", "output", "execution"});

        // Variables and values
        auto variables = root.find("variables");
        if (variables == root.end() || variables->is_null()) {
            return Error(ErrorCode::kConfigurationError,
                         "the settings do not contain the option 'variables'");
        }
        settings.variables = variables->get<std::string>();

        const json* values = nullptr;
        FLAMINGO_ASSIGN_OR_RETURN(values, section(root, "values"));
        if (values != nullptr) {
            for (auto it = values->begin(); it != values->end(); ++it) {
                std::vector<std::string> domain;
                FLAMINGO_ASSIGN_OR_RETURN(domain, domainValues(it.key(), it.value()));
                settings.values[it.key()] = std::move(domain);
            }
        }

        // Commands
        const json* testing = nullptr;
        FLAMINGO_ASSIGN_OR_RETURN(testing, section(root, "testing"));
        if (testing != nullptr) {
            warnUnknownKeys(*testing, "'testing'", {"compile", "test", "clean"});
        }
        settings.compile = optionalString(testing, "compile").value_or("");
        settings.clean = optionalString(testing, "clean").value_or("");
        auto test = optionalString(testing, "test");
        if (!test) {
            return Error(ErrorCode::kConfigurationError,
                         "the settings do not contain the option 'test' in 'testing'");
        }
        settings.test = *test;

        // Scoring
        const json* scoring = nullptr;
        FLAMINGO_ASSIGN_OR_RETURN(scoring, section(root, "scoring"));
        if (scoring != nullptr) {
            warnUnknownKeys(*scoring, "'scoring'", {"optimal", "repeat", "aggregator"});

            if (auto optimal = optionalString(scoring, "optimal")) {
                auto parsed = parseOptimal(*optimal);
                if (!parsed) {
                    return parsed.error();
                }
                settings.direction = parsed->direction;
                settings.custom_fom = parsed->custom_fom;
            }

            auto repeat = scoring->find("repeat");
            if (repeat != scoring->end() && !repeat->is_null()) {
                std::string repeat_text =
                    repeat->is_string() ? repeat->get<std::string>() : repeat->dump();
                auto parsed = parseRepeat(repeat_text);
                if (!parsed) {
                    return parsed.error();
                }
                settings.repeat = parsed->repeat;
                settings.aggregator = parsed->aggregator;
            }

            if (auto aggregator = optionalString(scoring, "aggregator")) {
                auto parsed = parseAggregator(*aggregator);
                if (!parsed) {
                    return parsed.error();
                }
                settings.aggregator = *parsed;
            }
        }

        // Output
        const json* output = nullptr;
        FLAMINGO_ASSIGN_OR_RETURN(output, section(root, "output"));
        if (output != nullptr) {
            warnUnknownKeys(*output, "'output'", {"log", "importance", "script", "summary"});
            auto path = [&](const char* key) -> std::optional<std::string> {
                auto value = optionalString(output, key);
                if (!value || value->empty()) {
                    return std::nullopt;
                }
                return resolvePath(base_directory, *value);
            };
            settings.log_path = path("log");
            settings.importance_path = path("importance");
            settings.script_path = path("script");
            settings.summary_path = path("summary");
        }

        // Execution
        const json* execution = nullptr;
        FLAMINGO_ASSIGN_OR_RETURN(execution, section(root, "execution"));
        if (execution != nullptr) {
            warnUnknownKeys(*execution, "'execution'",
                            {"resume", "parallelism", "command_timeout_seconds",
                             "cancel_grace_seconds", "max_failure_rate", "working_directory",
                             "log_level", "evaluation_strategy", "optimization_strategy"});

            if (auto resume = optionalString(execution, "resume"); resume && !resume->empty()) {
                settings.resume_path = resolvePath(base_directory, *resume);
            }
            auto parallelism = execution->find("parallelism");
            if (parallelism != execution->end() && !parallelism->is_null()) {
                if (!parallelism->is_number_integer() || parallelism->get<int64_t>() < 1) {
                    return Error(ErrorCode::kConfigurationError,
                                 fmt::format("invalid setting '{}' for 'parallelism', it must be "
                                             "a whole number of at least 1",
                                             parallelism->dump()));
                }
                settings.parallelism = static_cast<size_t>(parallelism->get<int64_t>());
            }
            settings.command_timeout_seconds =
                execution->value("command_timeout_seconds", settings.command_timeout_seconds);
            settings.cancel_grace_seconds =
                execution->value("cancel_grace_seconds", settings.cancel_grace_seconds);
            settings.max_failure_rate =
                execution->value("max_failure_rate", settings.max_failure_rate);
            if (auto dir = optionalString(execution, "working_directory")) {
                settings.working_directory = resolvePath(base_directory, *dir);
            }
            settings.log_level = execution->value("log_level", settings.log_level);
            settings.evaluation_strategy =
                execution->value("evaluation_strategy", settings.evaluation_strategy);
            settings.optimization_strategy =
                execution->value("optimization_strategy", settings.optimization_strategy);
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::kSettingsParseError,
                     fmt::format("cannot read the settings: {}", e.what()));
    }

    if (settings.working_directory.empty()) {
        settings.working_directory = base_directory;
    }
    return settings;
}

Result<TuningSettings> loadSettingsFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Error(ErrorCode::kIoError, fmt::format("cannot open settings file '{}'", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    std::string base = ec ? std::string() : absolute.parent_path().string();

    auto settings = parseSettingsJson(buffer.str(), base);
    if (!settings) {
        return Error(settings.error().code(),
                     fmt::format("{}: {}", path, settings.error().message()));
    }
    spdlog::debug("Loaded settings from '{}'", path);
    return settings;
}

}  // namespace tuner
}  // namespace flamingo
