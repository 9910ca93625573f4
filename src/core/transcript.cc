// =============================================================================
// Flamingo - Transcript Implementation
// =============================================================================

#include "flamingo/transcript.h"

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <vector>

namespace flamingo {

namespace {

constexpr const char* kTranscriptPattern = "%v";

std::shared_ptr<spdlog::logger> finish(std::shared_ptr<spdlog::logger> logger) {
    logger->set_pattern(kTranscriptPattern);
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    return logger;
}

}  // namespace

Result<std::shared_ptr<spdlog::logger>> makeTranscript(const std::string& name,
                                                       const TranscriptOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    if (!options.file_path.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file_path, true));
        } catch (const spdlog::spdlog_ex& e) {
            return Error(ErrorCode::kIoError,
                         fmt::format("cannot open transcript '{}': {}", options.file_path,
                                     e.what()));
        }
    }

    if (sinks.empty()) {
        return makeSilentTranscript(name);
    }
    return finish(std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end()));
}

std::shared_ptr<spdlog::logger> makeSilentTranscript(const std::string& name) {
    return finish(
        std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>()));
}

}  // namespace flamingo
