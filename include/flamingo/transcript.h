#pragma once

// =============================================================================
// Flamingo - Transcript
// =============================================================================
//
// The user-visible record of a tuning run (settings, per-test progress,
// results) is an spdlog logger with a bare "%v" pattern. It is created once
// and handed to the components that write to it; there is no global writer.
//

#include "flamingo/error.h"

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace flamingo {

struct TranscriptOptions {
    bool console = true;    // Echo to stdout
    std::string file_path;  // Empty = no transcript file
};

/// Logger writing to the requested sinks; a null sink when none is requested
[[nodiscard]] Result<std::shared_ptr<spdlog::logger>> makeTranscript(
    const std::string& name, const TranscriptOptions& options);

/// Logger that discards everything
[[nodiscard]] std::shared_ptr<spdlog::logger> makeSilentTranscript(const std::string& name);

}  // namespace flamingo
