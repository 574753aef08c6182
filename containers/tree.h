#ifndef TREE_H
#define TREE_H

#include <cstddef>
#include <iterator>
#include <memory>
#include <ostream>
#include <utility>
#include <stdexcept>
#include <vector>

// N-ary tree node. Each node owns its children; the root owns the whole tree.
template <typename T>
class TreeNode {
public:
    // Pre-order cursor. An explicit stack holds the nodes still to visit,
    // with the next child on top, so each subtree is finished before its next sibling.
    class DfsIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        DfsIterator() = default;
        explicit DfsIterator(const TreeNode* root) { pending.push_back(root); }

        reference operator*() const { return pending.back()->node_value; }
        pointer operator->() const { return &pending.back()->node_value; }

        DfsIterator& operator++() {
            const TreeNode* visited = pending.back();
            pending.pop_back();
            for (auto it = visited->child_nodes.rbegin(); it != visited->child_nodes.rend(); ++it) {
                pending.push_back(it->get());
            }
            return *this;
        }

        DfsIterator operator++(int) {
            DfsIterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const DfsIterator& other) const { return pending == other.pending; }
        bool operator!=(const DfsIterator& other) const { return !(*this == other); }

    private:
        std::vector<const TreeNode*> pending;
    };

    class DfsRange {
    public:
        explicit DfsRange(const TreeNode* root) : root(root) {}
        DfsIterator begin() const { return DfsIterator(root); }
        DfsIterator end() const { return DfsIterator(); }

    private:
        const TreeNode* root;
    };

    explicit TreeNode(const T& value) : node_value(value) {}

    // Descendants are released from a worklist so a deep tree is freed without recursion
    ~TreeNode() {
        std::vector<std::unique_ptr<TreeNode>> pending = std::move(child_nodes);
        while (!pending.empty()) {
            std::unique_ptr<TreeNode> node = std::move(pending.back());
            pending.pop_back();
            for (auto& child : node->child_nodes) {
                pending.push_back(std::move(child));
            }
            node->child_nodes.clear();
        }
    }

    TreeNode& addChild(const T& value) {
        child_nodes.push_back(std::make_unique<TreeNode>(value));
        return *child_nodes.back();
    }

    TreeNode& addChild(std::unique_ptr<TreeNode> child) {
        if (!child) {
            throw std::invalid_argument("TreeNode::addChild: null child");
        }
        child_nodes.push_back(std::move(child));
        return *child_nodes.back();
    }

    const T& value() const { return node_value; }
    const std::vector<std::unique_ptr<TreeNode>>& children() const { return child_nodes; }

    // Pre-order walk: this node, then each child's subtree in insertion order
    DfsRange dfs() const { return DfsRange(this); }

private:
    T node_value;
    std::vector<std::unique_ptr<TreeNode>> child_nodes;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const TreeNode<T>& node) {
    return os << "TreeNode(" << node.value() << ")";
}

#endif // TREE_H
