#ifndef STACK_H
#define STACK_H

#include <cstddef>
#include <ostream>
#include <utility>
#include <vector>
#include "container_errors.h"

// LIFO stack over a growable vector; the top is the back of the vector
template <typename T>
class Stack {
public:
    void push(const T& value) { items.push_back(value); }

    T pop() {
        requireNonEmpty("Stack::pop");
        T top = std::move(items.back());
        items.pop_back();
        return top;
    }

    const T& peek() const {
        requireNonEmpty("Stack::peek");
        return items.back();
    }

    std::size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }

    template <typename U>
    friend std::ostream& operator<<(std::ostream& os, const Stack<U>& stack);

private:
    std::vector<T> items;

    void requireNonEmpty(const char* operation) const {
        if (items.empty()) {
            throw EmptyCollection(std::string(operation) + ": stack is empty");
        }
    }
};

template <typename U>
std::ostream& operator<<(std::ostream& os, const Stack<U>& stack) {
    os << "Stack(top->[";
    for (auto it = stack.items.rbegin(); it != stack.items.rend(); ++it) {
        if (it != stack.items.rbegin()) os << ", ";
        os << *it;
    }
    return os << "])";
}

#endif // STACK_H
