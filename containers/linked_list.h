#ifndef LINKED_LIST_H
#define LINKED_LIST_H

#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <vector>
#include "container_errors.h"

// Singly linked list whose nodes live in an arena and link to each other by index.
// Position 0 is the head. Slots freed by remove() are recycled by later inserts.
template <typename T>
class LinkedList {
private:
    static constexpr int NIL = -1;

    struct Node {
        std::optional<T> value;
        int next;
    };

public:
    // Forward cursor over the chain starting at some node
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() : nodes(nullptr), current(NIL) {}
        Iterator(const std::vector<Node>* nodes, int current) : nodes(nodes), current(current) {}

        reference operator*() const { return *(*nodes)[current].value; }
        pointer operator->() const { return &*(*nodes)[current].value; }

        Iterator& operator++() {
            current = (*nodes)[current].next;
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const Iterator& other) const { return current == other.current; }
        bool operator!=(const Iterator& other) const { return current != other.current; }

    private:
        const std::vector<Node>* nodes;
        int current;
    };

    // A fresh pass over the list as it is when begin() is called
    class Traversal {
    public:
        explicit Traversal(const LinkedList* list) : list(list) {}
        Iterator begin() const { return Iterator(&list->nodes, list->head); }
        Iterator end() const { return Iterator(&list->nodes, NIL); }

    private:
        const LinkedList* list;
    };

    LinkedList() : head(NIL), free_head(NIL), count(0) {}

    // Insert so the new value ends up at position pos; valid for 0 <= pos <= size()
    void insert(std::size_t pos, const T& value) {
        if (pos > count) {
            throw IndexOutOfRange(indexMessage("LinkedList::insert", pos, count + 1));
        }
        int node = allocateNode(value);
        if (pos == 0) {
            nodes[node].next = head;
            head = node;
        } else {
            int prev = nodeAt(pos - 1);
            nodes[node].next = nodes[prev].next;
            nodes[prev].next = node;
        }
        count++;
    }

    void remove(std::size_t pos) {
        if (pos >= count) {
            throw IndexOutOfRange(indexMessage("LinkedList::remove", pos, count));
        }
        int removed;
        if (pos == 0) {
            removed = head;
            head = nodes[head].next;
        } else {
            int prev = nodeAt(pos - 1);
            removed = nodes[prev].next;
            nodes[prev].next = nodes[removed].next;
        }
        releaseNode(removed);
        count--;
    }

    Traversal traverse() const { return Traversal(this); }

    std::size_t size() const { return count; }
    bool empty() const { return count == 0; }

private:
    std::vector<Node> nodes;  // Arena; live and free nodes mixed
    int head;                 // First live node, NIL when empty
    int free_head;            // Chain of recycled slots, linked through next
    std::size_t count;

    int allocateNode(const T& value) {
        if (free_head != NIL) {
            int node = free_head;
            free_head = nodes[node].next;
            nodes[node].value = value;
            nodes[node].next = NIL;
            return node;
        }
        nodes.push_back(Node{value, NIL});
        return static_cast<int>(nodes.size()) - 1;
    }

    void releaseNode(int node) {
        nodes[node].value.reset();
        nodes[node].next = free_head;
        free_head = node;
    }

    // Caller guarantees pos < count
    int nodeAt(std::size_t pos) const {
        int current = head;
        for (std::size_t i = 0; i < pos; i++) {
            current = nodes[current].next;
        }
        return current;
    }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const LinkedList<T>& list) {
    os << "LinkedList([";
    bool first = true;
    for (const T& value : list.traverse()) {
        if (!first) os << ", ";
        os << value;
        first = false;
    }
    return os << "])";
}

#endif // LINKED_LIST_H
