#ifndef BENCHMARK_H
#define BENCHMARK_H

#include <chrono>
#include <ostream>
#include <random>
#include <string>
#include <vector>

enum class InputDistribution {
    RANDOM = 0,         // n uniform values in [0, n]
    SORTED = 1,         // 0, 1, ..., n-1
    REVERSE_SORTED = 2  // n, n-1, ..., 1
};

constexpr InputDistribution ALL_DISTRIBUTIONS[] = {
    InputDistribution::RANDOM,
    InputDistribution::SORTED,
    InputDistribution::REVERSE_SORTED
};

// Mean runtimes of both selectors for one input size and distribution
struct BenchmarkResult {
    int n;
    InputDistribution distribution;
    double deterministic_mean_ms;
    double randomized_mean_ms;
};

std::string distributionName(InputDistribution distribution);

std::vector<int> generateInput(InputDistribution distribution, int n, std::mt19937& g);

// Wall-clock time of func(arr) in milliseconds
template<typename Func>
double measureTime(Func func, std::vector<int>& arr) {
    auto start = std::chrono::high_resolution_clock::now();
    func(arr);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start;
    return elapsed.count();
}

// Times both selectors on trial_count fresh inputs per (size, distribution),
// drawing k uniformly from [0, n-1] for every trial. Trials run one after another.
std::vector<BenchmarkResult> runBenchmark(const std::vector<int>& sizes, int trial_count, std::mt19937& g);

void printResults(const std::vector<BenchmarkResult>& results, std::ostream& out);

// One plotted line: a selector's mean runtimes for one distribution, ordered as results
struct PlotSeries {
    std::string label;
    std::string marker;
    std::vector<double> sizes;
    std::vector<double> mean_ms;
};

// Two series (median of medians, then quickselect) per distribution present in results
std::vector<PlotSeries> collectPlotSeries(const std::vector<BenchmarkResult>& results);

// Mean runtime against n on log-log axes, one line per selector and distribution
void plotResults(const std::vector<BenchmarkResult>& results, const std::string& file);

#endif // BENCHMARK_H
