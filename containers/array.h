#ifndef ARRAY_H
#define ARRAY_H

#include <cstddef>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>
#include "container_errors.h"

// Fixed-capacity array with explicit O(n) shifting on insert and delete.
// Slots [0, size) always hold valid elements, slots [size, capacity) are empty.
template <typename T>
class Array {
public:
    explicit Array(std::size_t capacity) : data(capacity), count(0) {}

    // Insert value at index, shifting [index, size) one slot to the right.
    // index == size() appends.
    void insert(std::size_t index, const T& value) {
        if (count == data.size()) {
            throw CapacityExceeded("Array::insert: array is full (capacity " +
                                   std::to_string(data.size()) + ")");
        }
        if (index > count) {
            throw IndexOutOfRange(indexMessage("Array::insert", index, count + 1));
        }
        makeRoom(index);
        data[index] = value;
        count++;
    }

    void remove(std::size_t index) {
        validateIndex(index, "Array::remove");
        closeGap(index);
        count--;
    }

    const T& access(std::size_t index) const {
        validateIndex(index, "Array::access");
        return *data[index];
    }

    void update(std::size_t index, const T& value) {
        validateIndex(index, "Array::update");
        data[index] = value;
    }

    std::size_t size() const { return count; }
    std::size_t capacity() const { return data.size(); }
    bool empty() const { return count == 0; }

private:
    std::vector<std::optional<T>> data;
    std::size_t count;

    void validateIndex(std::size_t index, const char* operation) const {
        if (index >= count) {
            throw IndexOutOfRange(indexMessage(operation, index, count));
        }
    }

    void makeRoom(std::size_t index) {
        for (std::size_t i = count; i > index; i--) {
            data[i] = std::move(data[i - 1]);
        }
    }

    // The vacated tail slot is cleared so no stale element outlives its removal
    void closeGap(std::size_t index) {
        for (std::size_t i = index; i + 1 < count; i++) {
            data[i] = std::move(data[i + 1]);
        }
        data[count - 1].reset();
    }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Array<T>& array) {
    os << "Array([";
    for (std::size_t i = 0; i < array.size(); i++) {
        if (i > 0) os << ", ";
        os << array.access(i);
    }
    return os << "])";
}

#endif // ARRAY_H
