#include "linked_list.h"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace {

std::vector<int> collect(const LinkedList<int>& list) {
    std::vector<int> values;
    for (int value : list.traverse()) {
        values.push_back(value);
    }
    return values;
}

} // namespace

TEST(linked_list_test, head_insert_reverses_order) {
    LinkedList<int> list;
    for (int i = 0; i < 5; i++) {
        list.insert(0, i);
    }
    EXPECT_EQ(collect(list), (std::vector<int>{4, 3, 2, 1, 0}));
}

TEST(linked_list_test, delete_middle_position) {
    LinkedList<int> list;
    for (int i = 0; i < 5; i++) {
        list.insert(i, i);
    }
    list.remove(2);
    EXPECT_EQ(collect(list), (std::vector<int>{0, 1, 3, 4}));
    EXPECT_EQ(list.size(), 4u);

    std::ostringstream out;
    out << list;
    EXPECT_EQ(out.str(), "LinkedList([0, 1, 3, 4])");
}

TEST(linked_list_test, delete_head_and_tail) {
    LinkedList<int> list;
    for (int i = 0; i < 3; i++) {
        list.insert(i, i);
    }
    list.remove(0);
    list.remove(1);
    EXPECT_EQ(collect(list), (std::vector<int>{1}));
    list.remove(0);
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(collect(list), std::vector<int>{});
}

TEST(linked_list_test, position_out_of_range) {
    LinkedList<int> list;
    EXPECT_THROW(list.remove(0), IndexOutOfRange);
    EXPECT_THROW(list.insert(1, 5), IndexOutOfRange);

    list.insert(0, 5);
    EXPECT_THROW(list.remove(1), IndexOutOfRange);
    EXPECT_THROW(list.insert(2, 6), IndexOutOfRange);
    EXPECT_EQ(collect(list), (std::vector<int>{5}));
}

TEST(linked_list_test, traversal_is_restartable) {
    LinkedList<int> list;
    list.insert(0, 1);
    list.insert(1, 2);

    auto traversal = list.traverse();
    EXPECT_EQ(std::vector<int>(traversal.begin(), traversal.end()), (std::vector<int>{1, 2}));
    EXPECT_EQ(std::vector<int>(traversal.begin(), traversal.end()), (std::vector<int>{1, 2}));

    // A new traversal sees the current contents
    list.insert(2, 3);
    EXPECT_EQ(collect(list), (std::vector<int>{1, 2, 3}));
}

TEST(linked_list_test, recycled_slots_keep_order) {
    LinkedList<int> list;
    for (int i = 0; i < 4; i++) {
        list.insert(i, i);
    }
    list.remove(1);
    list.remove(1);
    list.insert(1, 10);
    list.insert(3, 20);
    list.insert(0, 30);
    EXPECT_EQ(collect(list), (std::vector<int>{30, 0, 10, 3, 20}));
}
