#include "benchmark.h"
#include "selection.h"
#include <iomanip>
#include <numeric>
#include <stdexcept>
#include <matplot/matplot.h>

std::string distributionName(InputDistribution distribution) {
    switch (distribution) {
        case InputDistribution::RANDOM: return "random";
        case InputDistribution::SORTED: return "sorted";
        case InputDistribution::REVERSE_SORTED: return "rev_sorted";
    }
    throw std::invalid_argument("Unknown input distribution");
}

std::vector<int> generateInput(InputDistribution distribution, int n, std::mt19937& g) {
    if (n < 0) {
        throw std::invalid_argument("Invalid input size: " + std::to_string(n));
    }
    std::vector<int> arr(n);
    switch (distribution) {
        case InputDistribution::RANDOM: {
            std::uniform_int_distribution<int> dist(0, n);
            for (int& value : arr) {
                value = dist(g);
            }
            break;
        }
        case InputDistribution::SORTED:
            std::iota(arr.begin(), arr.end(), 0);
            break;
        case InputDistribution::REVERSE_SORTED:
            std::iota(arr.rbegin(), arr.rend(), 1);
            break;
    }
    return arr;
}

std::vector<BenchmarkResult> runBenchmark(const std::vector<int>& sizes, int trial_count, std::mt19937& g) {
    if (trial_count <= 0) {
        throw std::invalid_argument("Invalid trial count: " + std::to_string(trial_count));
    }

    std::vector<BenchmarkResult> results;
    for (int n : sizes) {
        if (n <= 0) {
            throw std::invalid_argument("Invalid input size: " + std::to_string(n));
        }
        std::uniform_int_distribution<int> rank(0, n - 1);

        for (InputDistribution distribution : ALL_DISTRIBUTIONS) {
            double deterministic_total = 0.0;
            double randomized_total = 0.0;

            for (int trial = 0; trial < trial_count; trial++) {
                int k = rank(g);

                std::vector<int> arr = generateInput(distribution, n, g);
                deterministic_total += measureTime([k](auto& a) { selectDeterministic(a, k); }, arr);

                arr = generateInput(distribution, n, g);
                randomized_total += measureTime([k, &g](auto& a) { randomizedQuickselect(a, k, g); }, arr);
            }

            results.push_back({n, distribution,
                               deterministic_total / trial_count,
                               randomized_total / trial_count});
        }
    }
    return results;
}

void printResults(const std::vector<BenchmarkResult>& results, std::ostream& out) {
    std::ios_base::fmtflags saved_flags = out.flags();
    std::streamsize saved_precision = out.precision();

    out << std::fixed << std::setprecision(3);
    for (const auto& result : results) {
        out << std::setw(6) << result.n << " | "
            << std::left << std::setw(10) << distributionName(result.distribution) << std::right
            << " | mean runtime of deterministic median of medians = "
            << std::setw(8) << result.deterministic_mean_ms << " ms"
            << " | mean runtime of randomized quickselect = "
            << std::setw(8) << result.randomized_mean_ms << " ms\n";
    }

    out.flags(saved_flags);
    out.precision(saved_precision);
}

std::vector<PlotSeries> collectPlotSeries(const std::vector<BenchmarkResult>& results) {
    std::vector<PlotSeries> series;
    for (InputDistribution distribution : ALL_DISTRIBUTIONS) {
        PlotSeries deterministic{"median of medians (" + distributionName(distribution) + ")", "o", {}, {}};
        PlotSeries randomized{"quickselect (" + distributionName(distribution) + ")", "s", {}, {}};
        for (const auto& result : results) {
            if (result.distribution != distribution) continue;
            deterministic.sizes.push_back(result.n);
            deterministic.mean_ms.push_back(result.deterministic_mean_ms);
            randomized.sizes.push_back(result.n);
            randomized.mean_ms.push_back(result.randomized_mean_ms);
        }
        if (deterministic.sizes.empty()) continue;

        series.push_back(std::move(deterministic));
        series.push_back(std::move(randomized));
    }
    return series;
}

void plotResults(const std::vector<BenchmarkResult>& results, const std::string& file) {
    using namespace matplot;

    auto fig = figure(true);
    hold(on);
    std::vector<std::string> labels;

    for (const auto& line : collectPlotSeries(results)) {
        auto p = loglog(line.sizes, line.mean_ms);
        p->marker(line.marker);
        p->marker_face_color("auto");
        labels.push_back(line.label);
    }

    legend(labels);
    xlabel("Input Size (n)");
    ylabel("Mean Time (ms)");
    title("Selection Performance: Median of Medians vs Randomized Quickselect");
    grid(true);
    save(file);
}
