#include <exception>
#include <iostream>
#include <string>
#include "array.h"
#include "linked_list.h"
#include "matrix.h"
#include "queue.h"
#include "stack.h"
#include "tree.h"

int main() {
    try {
        std::cout << "Array:" << std::endl;
        Array<int> arr(5);
        for (int i = 0; i < 3; i++) {
            arr.insert(i, i * 10);
        }
        std::cout << arr << std::endl;
        arr.remove(1);
        std::cout << "after delete: " << arr << "\n" << std::endl;

        std::cout << "Matrix:" << std::endl;
        Matrix<int> matrix(3, 3);
        for (int i = 0; i < 3; i++) {
            matrix.set(i, i, 1);
        }
        std::cout << matrix << "\n" << std::endl;

        std::cout << "Stack:" << std::endl;
        Stack<char> s;
        for (char c : std::string("abcd")) {
            s.push(c);
        }
        std::cout << s << std::endl;
        char popped = s.pop();
        std::cout << "pop-> " << popped << " peek-> " << s.peek() << "\n" << std::endl;

        std::cout << "Queue:" << std::endl;
        Queue<int> q(4);
        for (int i = 0; i < 3; i++) {
            q.enqueue(i);
        }
        std::cout << q << std::endl;
        int front = q.dequeue();
        std::cout << "dequeue-> " << front << " " << q << std::endl;
        q.enqueue(99);
        std::cout << "after enqueue 99: " << q << "\n" << std::endl;

        std::cout << "LinkedList:" << std::endl;
        LinkedList<int> ll;
        for (int i = 0; i < 5; i++) {
            ll.insert(i, i);
        }
        std::cout << ll << std::endl;
        ll.remove(2);
        std::cout << "after delete pos2: " << ll << "\n" << std::endl;

        std::cout << "Tree demo (DFS):" << std::endl;
        TreeNode<std::string> root("root");
        TreeNode<std::string>& child_a = root.addChild("A");
        TreeNode<std::string>& child_b = root.addChild("B");
        child_a.addChild("A1");
        child_b.addChild("B1");
        child_b.addChild("B2");
        std::cout << "DFS traversal: [";
        bool first = true;
        for (const std::string& value : root.dfs()) {
            std::cout << (first ? "" : ", ") << value;
            first = false;
        }
        std::cout << "]" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
