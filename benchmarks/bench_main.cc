// =============================================================================
// Flamingo - Benchmark Entry Point
// =============================================================================

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

#include <spdlog/spdlog.h>

namespace flamingo {
void benchEnumeration();
void benchResultLog();
}  // namespace flamingo

int main() {
    spdlog::set_level(spdlog::level::warn);

    flamingo::benchEnumeration();
    flamingo::benchResultLog();
    return 0;
}
