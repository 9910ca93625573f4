#pragma once

// =============================================================================
// Flamingo - Result Log
// =============================================================================
//
// In-memory and persisted record of tested valuations.
//
// - ResultLog: append-only, thread-safe container keyed by valuation value.
//   At most one record exists per distinct valuation.
// - ResultLogWriter: streams rows to a CSV file, flushing after every row so
//   an interrupted run never leaves a partially written row behind.
// - readResultLog / parseResultLog: load a prior run for resume.
//
// CSV layout:
//   TestNo, <flattened variables...>, Score_1..Score_R, Score_Overall, Outcome
//
// Inactive variables and discarded repetitions are empty cells. Outcome is
// "ok" for a success, otherwise the failure reason.
//

#include "flamingo/common.h"
#include "flamingo/error.h"
#include "flamingo/tuner/test_record.h"

#include <cstddef>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace flamingo {
namespace tuner {

class ConfigurationSpace;

// =============================================================================
// ResultLog
// =============================================================================

class ResultLog : NonCopyable {
  public:
    ResultLog() = default;

    /// Append a record; returns false (and drops it) if an equal valuation exists
    bool append(TestRecord record);

    [[nodiscard]] bool contains(const Valuation& valuation) const;

    /// Copy of the record for an equal valuation
    [[nodiscard]] std::optional<TestRecord> find(const Valuation& valuation) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// All records in append order
    [[nodiscard]] std::vector<TestRecord> snapshot() const;

    /// Failed records in append order
    [[nodiscard]] std::vector<TestRecord> failures() const;
    [[nodiscard]] size_t numFailures() const;

    /// One past the highest test id in the log (1 for an empty log)
    [[nodiscard]] TestId nextTestId() const;

  private:
    mutable std::mutex mutex_;
    std::deque<TestRecord> records_;
    std::unordered_map<std::string, size_t> index_;  // Valuation key -> position
    size_t num_failures_ = 0;
    TestId max_id_ = 0;
};

// =============================================================================
// CSV Format
// =============================================================================

/// Escape one cell (quote when it contains a separator, quote or newline)
[[nodiscard]] std::string escapeCsvCell(std::string_view cell);

/// Join escaped cells into one line (without the trailing newline)
[[nodiscard]] std::string formatCsvRow(const std::vector<std::string>& cells);

/// Split CSV text into rows of unescaped cells. Blank lines are dropped.
[[nodiscard]] Result<std::vector<std::vector<std::string>>> parseCsv(std::string_view content);

/// Column header for a log over `variables` with `repeat` repetitions
[[nodiscard]] std::vector<std::string> resultLogHeader(const std::vector<std::string>& variables,
                                                       size_t repeat);

/// Cells of one record, aligned with resultLogHeader()
[[nodiscard]] std::vector<std::string> resultLogRow(const TestRecord& record,
                                                    const std::vector<std::string>& variables,
                                                    size_t repeat);

// =============================================================================
// Reading
// =============================================================================

struct LoadedLog {
    std::vector<TestRecord> records;
    size_t repeat = 0;          // Repetition columns in the file
    size_t skipped_rows = 0;    // Malformed rows or valuations outside the space
};

/// Parse log text; the header must name exactly space.flatten()
[[nodiscard]] Result<LoadedLog> parseResultLog(std::string_view content,
                                               const ConfigurationSpace& space);

[[nodiscard]] Result<LoadedLog> readResultLog(const std::string& path,
                                              const ConfigurationSpace& space);

// =============================================================================
// Writing
// =============================================================================

class ResultLogWriter : NonCopyable {
  public:
    /// Create (truncate) the file and write the header
    [[nodiscard]] static Result<std::unique_ptr<ResultLogWriter>> open(
        const std::string& path, std::vector<std::string> variables, size_t repeat);

    ~ResultLogWriter();

    /// Append one row and flush
    [[nodiscard]] Result<void> write(const TestRecord& record);

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] size_t rowsWritten() const;

  private:
    ResultLogWriter(std::string path, std::vector<std::string> variables, size_t repeat);

    std::string path_;
    std::vector<std::string> variables_;
    size_t repeat_;
    std::ofstream out_;
    size_t rows_ = 0;
    mutable std::mutex mutex_;
};

/// Write a complete log in one go
[[nodiscard]] Result<void> writeResultLog(const std::string& path,
                                          const std::vector<std::string>& variables,
                                          size_t repeat, const std::vector<TestRecord>& records);

}  // namespace tuner
}  // namespace flamingo
