// =============================================================================
// Flamingo - Result Log Benchmarks
// =============================================================================

#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/result_log.h"

#include <nanobench.h>

#include <string>

namespace flamingo {

void benchResultLog() {
    ankerl::nanobench::Bench bench;
    bench.title("Result Log");

    tuner::DomainMap domains = {
        {"threads", {"1", "2", "4", "8", "16", "32", "64", "128"}},
        {"blocks", {"1", "2", "4", "8", "16", "32", "64", "128"}},
        {"unroll", {"1", "2", "4", "8"}},
    };
    auto tree = tuner::VariableTree::parse("threads, blocks, unroll", domains);
    auto space = tuner::ConfigurationSpace::create(std::move(*tree));
    const auto columns = space->flatten();

    std::string content = tuner::formatCsvRow(tuner::resultLogHeader(columns, 3)) + "\n";
    tuner::TestId id = 1;
    for (const auto& valuation : space->enumerateAll()) {
        auto record = tuner::TestRecord::success(id, valuation, {0.5, 0.25, 0.75}, 0.25);
        content += tuner::formatCsvRow(tuner::resultLogRow(record, columns, 3)) + "\n";
        ++id;
    }

    bench.run("Format: 256 rows", [&] {
        size_t bytes = 0;
        tuner::TestId row_id = 1;
        for (const auto& valuation : space->enumerateAll()) {
            auto record = tuner::TestRecord::success(row_id++, valuation, {1.0}, 1.0);
            bytes += tuner::formatCsvRow(tuner::resultLogRow(record, columns, 1)).size();
        }
        ankerl::nanobench::doNotOptimizeAway(bytes);
    });

    bench.run("Parse: 256 rows", [&] {
        auto loaded = tuner::parseResultLog(content, *space);
        ankerl::nanobench::doNotOptimizeAway(loaded->records.size());
    });

    tuner::ResultLog log;
    for (const auto& record : tuner::parseResultLog(content, *space)->records) {
        log.append(record);
    }
    auto probes = space->enumerateAll();
    bench.run("Lookup: 256 valuations", [&] {
        size_t hits = 0;
        for (const auto& valuation : probes) {
            hits += log.contains(valuation) ? 1 : 0;
        }
        ankerl::nanobench::doNotOptimizeAway(hits);
    });
}

}  // namespace flamingo
