#ifndef CONTAINER_ERRORS_H
#define CONTAINER_ERRORS_H

#include <stdexcept>
#include <string>

// Read, write or position outside the valid bounds of a container
class IndexOutOfRange : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Insertion into a fixed-capacity container that is already full
class CapacityExceeded : public std::length_error {
public:
    using std::length_error::length_error;
};

// pop / peek / dequeue on a container holding no elements
class EmptyCollection : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline std::string indexMessage(const char* what, std::size_t index, std::size_t bound) {
    return std::string(what) + ": index " + std::to_string(index) +
           " out of range [0, " + std::to_string(bound) + ")";
}

#endif // CONTAINER_ERRORS_H
