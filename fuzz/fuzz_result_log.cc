// =============================================================================
// Flamingo - Result Log Parser Fuzz Target
// =============================================================================

#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/result_log.h"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace {

const flamingo::tuner::ConfigurationSpace& fuzzSpace() {
    static const flamingo::tuner::ConfigurationSpace space = [] {
        flamingo::tuner::DomainMap domains = {
            {"threads", {"16", "32", "64"}},
            {"blocks", {"8", "16"}},
        };
        auto tree = flamingo::tuner::VariableTree::parse("threads, blocks[threads=64]", domains);
        return std::move(*flamingo::tuner::ConfigurationSpace::create(std::move(*tree)));
    }();
    return space;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string_view content(reinterpret_cast<const char*>(data), size);

    auto loaded = flamingo::tuner::parseResultLog(content, fuzzSpace());
    if (!loaded)
        return 0;

    // Every loaded record must belong to the space
    for (const auto& record : loaded->records) {
        if (!fuzzSpace().contains(record.valuation))
            __builtin_trap();
    }
    return 0;
}
