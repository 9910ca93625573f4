// =============================================================================
// Flamingo - Result Log Implementation
// =============================================================================

#include "flamingo/tuner/result_log.h"

#include "flamingo/string_util.h"
#include "flamingo/tuner/configuration_space.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace flamingo {
namespace tuner {

namespace {

constexpr std::string_view kIdColumn = "TestNo";
constexpr std::string_view kScorePrefix = "Score_";
constexpr std::string_view kOverallColumn = "Score_Overall";
constexpr std::string_view kOutcomeColumn = "Outcome";
constexpr std::string_view kOutcomeOk = "ok";

std::string formatScore(double score) {
    // Shortest representation that reads back to the same double
    return fmt::format("{}", score);
}

}  // namespace

// =============================================================================
// ResultLog
// =============================================================================

bool ResultLog::append(TestRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = record.valuation.key();
    if (index_.count(key) > 0) {
        return false;
    }

    if (!record.succeeded()) {
        ++num_failures_;
    }
    max_id_ = std::max(max_id_, record.id);
    index_.emplace(std::move(key), records_.size());
    records_.push_back(std::move(record));
    return true;
}

bool ResultLog::contains(const Valuation& valuation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(valuation.key()) > 0;
}

std::optional<TestRecord> ResultLog::find(const Valuation& valuation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(valuation.key());
    if (it == index_.end()) {
        return std::nullopt;
    }
    return records_[it->second];
}

size_t ResultLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<TestRecord> ResultLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<TestRecord>(records_.begin(), records_.end());
}

std::vector<TestRecord> ResultLog::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TestRecord> failed;
    failed.reserve(num_failures_);
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(failed),
                 [](const TestRecord& record) { return !record.succeeded(); });
    return failed;
}

size_t ResultLog::numFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_failures_;
}

TestId ResultLog::nextTestId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_id_ + 1;
}

// =============================================================================
// CSV Format
// =============================================================================

std::string escapeCsvCell(std::string_view cell) {
    bool need_quote = false;
    for (char c : cell) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') {
            need_quote = true;
            break;
        }
    }
    if (!need_quote) {
        return std::string(cell);
    }

    std::string out;
    out.reserve(cell.size() + 2);
    out.push_back('"');
    for (char c : cell) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string formatCsvRow(const std::vector<std::string>& cells) {
    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            line.push_back(',');
        }
        line += escapeCsvCell(cells[i]);
    }
    return line;
}

Result<std::vector<std::vector<std::string>>> parseCsv(std::string_view content) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool cell_was_quoted = false;
    size_t line = 1;

    auto endCell = [&]() {
        row.push_back(std::move(cell));
        cell.clear();
        cell_was_quoted = false;
    };
    auto endRow = [&]() {
        endCell();
        // A blank line parses as a single empty cell
        if (!(row.size() == 1 && row[0].empty())) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                cell.push_back(c);
            }
            continue;
        }

        switch (c) {
        case '"':
            if (!cell.empty() || cell_was_quoted) {
                return Error(ErrorCode::kMalformedLog,
                             fmt::format("unexpected quote on line {}", line));
            }
            in_quotes = true;
            cell_was_quoted = true;
            break;
        case ',':
            endCell();
            break;
        case '\r':
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                break;
            }
            endRow();
            ++line;
            break;
        case '\n':
            endRow();
            ++line;
            break;
        default:
            if (cell_was_quoted) {
                return Error(ErrorCode::kMalformedLog,
                             fmt::format("text after a closing quote on line {}", line));
            }
            cell.push_back(c);
            break;
        }
    }

    if (in_quotes) {
        return Error(ErrorCode::kMalformedLog, "unterminated quoted cell at end of log");
    }
    if (!cell.empty() || cell_was_quoted || !row.empty()) {
        endRow();
    }
    return rows;
}

std::vector<std::string> resultLogHeader(const std::vector<std::string>& variables,
                                         size_t repeat) {
    std::vector<std::string> header;
    header.reserve(variables.size() + repeat + 3);
    header.emplace_back(kIdColumn);
    header.insert(header.end(), variables.begin(), variables.end());
    for (size_t i = 1; i <= repeat; ++i) {
        header.push_back(fmt::format("{}{}", kScorePrefix, i));
    }
    header.emplace_back(kOverallColumn);
    header.emplace_back(kOutcomeColumn);
    return header;
}

std::vector<std::string> resultLogRow(const TestRecord& record,
                                      const std::vector<std::string>& variables, size_t repeat) {
    std::vector<std::string> row;
    row.reserve(variables.size() + repeat + 3);
    row.push_back(std::to_string(record.id));

    for (const auto& name : variables) {
        const std::string* value = record.valuation.find(name);
        row.push_back(value != nullptr ? *value : std::string());
    }

    for (size_t i = 0; i < repeat; ++i) {
        if (i < record.raw_scores.size() && record.raw_scores[i]) {
            row.push_back(formatScore(*record.raw_scores[i]));
        } else {
            row.emplace_back();
        }
    }

    row.push_back(record.aggregate_score ? formatScore(*record.aggregate_score) : std::string());
    row.push_back(record.succeeded() ? std::string(kOutcomeOk) : record.failure_reason);
    return row;
}

// =============================================================================
// Reading
// =============================================================================

namespace {

struct HeaderLayout {
    std::vector<std::string> variables;
    size_t repeat = 0;
};

Result<HeaderLayout> parseHeader(const std::vector<std::string>& header,
                                 const std::vector<std::string>& expected) {
    if (header.empty() || header.front() != kIdColumn) {
        return Error(ErrorCode::kMalformedLog,
                     fmt::format("the first column of the log must be '{}'", kIdColumn));
    }

    // Variable names may themselves look like score columns, so the declared
    // variables are matched by position
    HeaderLayout layout;
    size_t col = 1;
    while (col < header.size() && col <= expected.size()) {
        layout.variables.push_back(header[col]);
        ++col;
    }

    if (layout.variables != expected) {
        return Error(ErrorCode::kConfigurationError,
                     fmt::format("the log columns [{}] do not match the declared variables [{}]",
                                 fmt::join(layout.variables, ", "), fmt::join(expected, ", ")));
    }
    if (col < header.size() && header[col].rfind(kScorePrefix, 0) != 0) {
        return Error(ErrorCode::kConfigurationError,
                     fmt::format("the log has the variable column '{}', which is not declared",
                                 header[col]));
    }

    while (col < header.size() && header[col] != kOverallColumn) {
        if (header[col] != fmt::format("{}{}", kScorePrefix, layout.repeat + 1)) {
            return Error(ErrorCode::kMalformedLog,
                         fmt::format("unexpected log column '{}'", header[col]));
        }
        ++layout.repeat;
        ++col;
    }

    if (col + 2 != header.size() || header[col] != kOverallColumn ||
        header[col + 1] != kOutcomeColumn) {
        return Error(ErrorCode::kMalformedLog,
                     fmt::format("the log must end with the columns '{}' and '{}'",
                                 kOverallColumn, kOutcomeColumn));
    }
    return layout;
}

std::optional<TestRecord> parseRow(const std::vector<std::string>& row,
                                   const HeaderLayout& layout, size_t line) {
    size_t expected = 1 + layout.variables.size() + layout.repeat + 2;
    if (row.size() != expected) {
        spdlog::warn("Log row {} has {} columns, expected {}; skipped", line, row.size(),
                     expected);
        return std::nullopt;
    }

    TestRecord record;
    auto id = parseUnsigned(row[0]);
    if (!id) {
        spdlog::warn("Log row {} has an invalid test number '{}'; skipped", line, row[0]);
        return std::nullopt;
    }
    record.id = *id;

    size_t col = 1;
    for (const auto& name : layout.variables) {
        if (!row[col].empty()) {
            record.valuation.set(name, row[col]);
        }
        ++col;
    }

    record.raw_scores.reserve(layout.repeat);
    for (size_t i = 0; i < layout.repeat; ++i, ++col) {
        if (row[col].empty()) {
            record.raw_scores.emplace_back();
            continue;
        }
        auto score = parseDouble(row[col]);
        if (!score) {
            spdlog::warn("Log row {} has an invalid score '{}'; skipped", line, row[col]);
            return std::nullopt;
        }
        record.raw_scores.emplace_back(*score);
    }

    const std::string& overall = row[col];
    const std::string& outcome = row[col + 1];

    if (outcome == kOutcomeOk) {
        auto score = parseDouble(overall);
        if (!score) {
            spdlog::warn("Log row {} is marked ok but has no overall score; skipped", line);
            return std::nullopt;
        }
        record.aggregate_score = *score;
        record.outcome = Outcome::kSuccess;
    } else {
        record.outcome = Outcome::kFailure;
        record.failure_reason = outcome.empty() ? std::string(kReasonNoValidMeasurements) : outcome;
    }
    return record;
}

}  // namespace

Result<LoadedLog> parseResultLog(std::string_view content, const ConfigurationSpace& space) {
    auto rows = parseCsv(content);
    if (!rows) {
        return rows.error();
    }
    if (rows->empty()) {
        return Error(ErrorCode::kMalformedLog, "the log is empty");
    }

    auto layout = parseHeader(rows->front(), space.flatten());
    if (!layout) {
        return layout.error();
    }

    LoadedLog loaded;
    loaded.repeat = layout->repeat;

    std::unordered_map<std::string, size_t> seen;
    for (size_t i = 1; i < rows->size(); ++i) {
        auto record = parseRow((*rows)[i], *layout, i + 1);
        if (!record) {
            ++loaded.skipped_rows;
            continue;
        }
        if (!space.contains(record->valuation)) {
            spdlog::warn("Log row {} ({}) is not a valid configuration; skipped", i + 1,
                         record->valuation.toString(", "));
            ++loaded.skipped_rows;
            continue;
        }
        if (!seen.emplace(record->valuation.key(), i).second) {
            spdlog::warn("Log row {} repeats an earlier configuration; skipped", i + 1);
            ++loaded.skipped_rows;
            continue;
        }
        loaded.records.push_back(std::move(*record));
    }

    spdlog::debug("Loaded {} records from log ({} skipped)", loaded.records.size(),
                  loaded.skipped_rows);
    return loaded;
}

Result<LoadedLog> readResultLog(const std::string& path, const ConfigurationSpace& space) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::kIoError, fmt::format("cannot open log file '{}'", path));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error(ErrorCode::kIoError, fmt::format("failed reading log file '{}'", path));
    }

    auto loaded = parseResultLog(buffer.str(), space);
    if (!loaded) {
        return Error(loaded.error().code(),
                     fmt::format("{}: {}", path, loaded.error().message()));
    }
    return loaded;
}

// =============================================================================
// Writing
// =============================================================================

ResultLogWriter::ResultLogWriter(std::string path, std::vector<std::string> variables,
                                 size_t repeat)
    : path_(std::move(path)), variables_(std::move(variables)), repeat_(repeat) {}

ResultLogWriter::~ResultLogWriter() {
    if (out_.is_open()) {
        out_.flush();
    }
}

Result<std::unique_ptr<ResultLogWriter>> ResultLogWriter::open(const std::string& path,
                                                               std::vector<std::string> variables,
                                                               size_t repeat) {
    std::unique_ptr<ResultLogWriter> writer(
        new ResultLogWriter(path, std::move(variables), repeat));

    writer->out_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!writer->out_) {
        return Error(ErrorCode::kIoError,
                     fmt::format("cannot open log file '{}' for writing", path));
    }

    writer->out_ << formatCsvRow(resultLogHeader(writer->variables_, writer->repeat_)) << '\n';
    writer->out_.flush();
    if (!writer->out_) {
        return Error(ErrorCode::kIoError, fmt::format("failed writing log file '{}'", path));
    }
    return std::move(writer);
}

Result<void> ResultLogWriter::write(const TestRecord& record) {
    // Format before locking, the row is emitted in one piece
    std::string line = formatCsvRow(resultLogRow(record, variables_, repeat_));
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line;
    out_.flush();
    if (!out_) {
        return Error(ErrorCode::kIoError, fmt::format("failed writing log file '{}'", path_));
    }
    ++rows_;
    return {};
}

size_t ResultLogWriter::rowsWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_;
}

Result<void> writeResultLog(const std::string& path, const std::vector<std::string>& variables,
                            size_t repeat, const std::vector<TestRecord>& records) {
    auto writer = ResultLogWriter::open(path, variables, repeat);
    if (!writer) {
        return writer.error();
    }
    for (const auto& record : records) {
        FLAMINGO_TRY((*writer)->write(record));
    }
    return {};
}

}  // namespace tuner
}  // namespace flamingo
