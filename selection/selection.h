#ifndef SELECTION_H
#define SELECTION_H

#include <algorithm>
#include <cstddef>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace selection_detail {

// Indices are int, so inputs longer than INT_MAX are rejected
inline int checkedSize(std::size_t size, const char* operation) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::out_of_range(std::string(operation) + ": input of size " +
                                std::to_string(size) + " exceeds the int index range");
    }
    return static_cast<int>(size);
}

inline void validateRange(int size, int low, int high, const char* operation) {
    if (low < 0 || high >= size || low > high) {
        throw std::out_of_range(std::string(operation) + ": invalid range [" +
                                std::to_string(low) + ", " + std::to_string(high) +
                                "] for size " + std::to_string(size));
    }
}

inline void validateRank(int size, int k, const char* operation) {
    if (k < 0 || k >= size) {
        throw std::out_of_range(std::string(operation) + ": k = " + std::to_string(k) +
                                " out of range for size " + std::to_string(size));
    }
}

// Sort a group of indices by the values they refer to and return its middle index
template <typename T>
int medianIndexOfGroup(const std::vector<T>& arr, std::vector<int>& group) {
    std::sort(group.begin(), group.end(), [&arr](int a, int b) { return arr[a] < arr[b]; });
    return group[group.size() / 2];
}

} // namespace selection_detail

// Lomuto partition of arr[low..high] around arr[pivot_idx].
// Afterwards arr[low..p-1] < arr[p] <= arr[p+1..high]; returns p.
template <typename T>
int partition(std::vector<T>& arr, int low, int high, int pivot_idx) {
    const int size = selection_detail::checkedSize(arr.size(), "partition");
    selection_detail::validateRange(size, low, high, "partition");
    if (pivot_idx < low || pivot_idx > high) {
        throw std::out_of_range("partition: pivot index " + std::to_string(pivot_idx) +
                                " outside [" + std::to_string(low) + ", " +
                                std::to_string(high) + "]");
    }

    std::swap(arr[pivot_idx], arr[high]);
    const T& pivot = arr[high];
    int partition_idx = low;
    for (int j = low; j < high; j++) {
        if (arr[j] < pivot) {
            std::swap(arr[j], arr[partition_idx]);
            partition_idx++;
        }
    }
    std::swap(arr[partition_idx], arr[high]);
    return partition_idx;
}

// Index in [low, high] of a pivot with roughly 30% of the range on either side.
// Groups of five indices are replaced by their median index until at most five remain,
// then the median of those is returned. arr is not modified.
template <typename T>
int medianOfMedians(const std::vector<T>& arr, int low, int high) {
    selection_detail::validateRange(selection_detail::checkedSize(arr.size(), "medianOfMedians"), low, high, "medianOfMedians");

    std::vector<int> indices(high - low + 1);
    for (int i = 0; i < static_cast<int>(indices.size()); i++) {
        indices[i] = low + i;
    }

    while (indices.size() > 5) {
        std::vector<int> medians;
        medians.reserve((indices.size() + 4) / 5);
        for (std::size_t start = 0; start < indices.size(); start += 5) {
            std::size_t stop = std::min(start + 5, indices.size());
            std::vector<int> group(indices.begin() + start, indices.begin() + stop);
            medians.push_back(selection_detail::medianIndexOfGroup(arr, group));
        }
        indices = std::move(medians);
    }

    return selection_detail::medianIndexOfGroup(arr, indices);
}

// k-th smallest element (0-based) in worst-case linear time.
// arr is partially reordered; k outside [0, size) throws std::out_of_range,
// as does an input longer than INT_MAX.
template <typename T>
T selectDeterministic(std::vector<T>& arr, int k) {
    const int size = selection_detail::checkedSize(arr.size(), "selectDeterministic");
    selection_detail::validateRank(size, k, "selectDeterministic");

    int low = 0;
    int high = size - 1;
    while (low != high) {
        int pivot_idx = medianOfMedians(arr, low, high);
        pivot_idx = partition(arr, low, high, pivot_idx);

        if (k == pivot_idx)
            return arr[k];
        else if (k < pivot_idx)
            high = pivot_idx - 1;
        else
            low = pivot_idx + 1;
    }
    return arr[low];
}

// k-th smallest element (0-based) using uniformly random pivots from g.
// Expected linear time; arr is partially reordered.
template <typename T>
T randomizedQuickselect(std::vector<T>& arr, int k, std::mt19937& g) {
    const int size = selection_detail::checkedSize(arr.size(), "randomizedQuickselect");
    selection_detail::validateRank(size, k, "randomizedQuickselect");

    int low = 0;
    int high = size - 1;
    while (low != high) {
        std::uniform_int_distribution<int> dist(low, high);
        int pivot_idx = partition(arr, low, high, dist(g));

        if (k == pivot_idx)
            return arr[k];
        else if (k < pivot_idx)
            high = pivot_idx - 1;
        else
            low = pivot_idx + 1;
    }
    return arr[low];
}

template <typename T>
T randomizedQuickselect(std::vector<T>& arr, int k) {
    std::random_device rd;
    std::mt19937 g(rd());
    return randomizedQuickselect(arr, k, g);
}

#endif // SELECTION_H
