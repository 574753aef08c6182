#ifndef QUEUE_H
#define QUEUE_H

#include <cstddef>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>
#include "container_errors.h"

// Fixed-capacity FIFO queue on a circular buffer.
// head is the next slot to dequeue, tail the next slot to fill; both wrap mod capacity.
template <typename T>
class Queue {
public:
    explicit Queue(std::size_t capacity) : buffer(capacity), head(0), tail(0), count(0) {}

    void enqueue(const T& value) {
        if (count == buffer.size()) {
            throw CapacityExceeded("Queue::enqueue: queue is full (capacity " +
                                   std::to_string(buffer.size()) + ")");
        }
        buffer[tail] = value;
        tail = (tail + 1) % buffer.size();
        count++;
    }

    T dequeue() {
        if (count == 0) {
            throw EmptyCollection("Queue::dequeue: queue is empty");
        }
        T value = std::move(*buffer[head]);
        buffer[head].reset();
        head = (head + 1) % buffer.size();
        count--;
        return value;
    }

    std::size_t size() const { return count; }
    std::size_t capacity() const { return buffer.size(); }
    bool empty() const { return count == 0; }
    bool full() const { return count == buffer.size(); }

    // Physical slot inspection, independent of head/tail
    bool isSlotCleared(std::size_t slot) const {
        if (slot >= buffer.size()) {
            throw IndexOutOfRange(indexMessage("Queue::isSlotCleared", slot, buffer.size()));
        }
        return !buffer[slot].has_value();
    }

    // Element at logical position i counted from the head
    const T& at(std::size_t i) const {
        if (i >= count) {
            throw IndexOutOfRange(indexMessage("Queue::at", i, count));
        }
        return *buffer[(head + i) % buffer.size()];
    }

private:
    std::vector<std::optional<T>> buffer;
    std::size_t head;
    std::size_t tail;
    std::size_t count;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Queue<T>& queue) {
    os << "Queue([";
    for (std::size_t i = 0; i < queue.size(); i++) {
        if (i > 0) os << ", ";
        os << queue.at(i);
    }
    return os << "])";
}

#endif // QUEUE_H
