#include <cstring>
#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "benchmark.h"
#include "benchmark_constants.h"

int main(int argc, char* argv[]) {
    int trial_count = benchmark_constants::TRIAL_COUNT;
    bool make_plot = true;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--no-plot") == 0) {
            make_plot = false;
        } else if (std::strcmp(argv[i], "--trials") == 0 && i + 1 < argc) {
            try {
                trial_count = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid trial count: " << argv[i] << std::endl;
                return 1;
            }
            if (trial_count <= 0) {
                std::cerr << "Trial count must be positive" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Usage: " << argv[0] << " [--trials <n>] [--no-plot]" << std::endl;
            return 1;
        }
    }

    try {
        std::random_device rd;
        std::mt19937 g(rd());
        std::vector<int> sizes(benchmark_constants::INPUT_SIZES.begin(), benchmark_constants::INPUT_SIZES.end());

        std::cout << "Selection benchmark: " << trial_count << " trials per case" << std::endl;
        std::vector<BenchmarkResult> results = runBenchmark(sizes, trial_count, g);
        printResults(results, std::cout);

        if (make_plot) {
            std::string file(benchmark_constants::PLOT_FILE);
            plotResults(results, file);
            std::cout << "Plot saved to " << file << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
