#ifndef BENCHMARK_CONSTANTS_H
#define BENCHMARK_CONSTANTS_H

#include <array>
#include <string_view>

namespace benchmark_constants {
    constexpr int TRIAL_COUNT = 100;                            // Trials per (size, distribution)
    constexpr std::array<int, 3> INPUT_SIZES = {100, 1000, 10000};
    constexpr std::string_view PLOT_FILE = "selection_benchmark.png";
}

#endif // BENCHMARK_CONSTANTS_H
