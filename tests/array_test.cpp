#include "array.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

TEST(array_test, insert_delete_scenario) {
    Array<int> arr(5);
    for (int i = 0; i < 3; i++) {
        arr.insert(i, i * 10);
    }
    arr.remove(1);

    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(arr.access(0), 0);
    EXPECT_EQ(arr.access(1), 20);
}

TEST(array_test, insert_past_capacity_throws) {
    Array<int> arr(3);
    for (int i = 0; i < 3; i++) {
        arr.insert(i, i);
    }
    EXPECT_THROW(arr.insert(0, 42), CapacityExceeded);
    EXPECT_EQ(arr.size(), 3u);
    EXPECT_EQ(arr.access(0), 0);
}

TEST(array_test, insert_then_delete_same_index_is_noop) {
    Array<int> arr(6);
    for (int i = 0; i < 4; i++) {
        arr.insert(i, i + 1);
    }
    arr.insert(2, 99);
    arr.remove(2);

    ASSERT_EQ(arr.size(), 4u);
    for (int i = 0; i < 4; i++) {
        EXPECT_EQ(arr.access(i), i + 1);
    }
}

TEST(array_test, insert_shifts_right) {
    Array<std::string> arr(4);
    arr.insert(0, "b");
    arr.insert(0, "a");
    arr.insert(2, "d");
    arr.insert(2, "c");

    std::ostringstream out;
    out << arr;
    EXPECT_EQ(out.str(), "Array([a, b, c, d])");
}

TEST(array_test, out_of_range_indices) {
    Array<int> arr(4);
    EXPECT_THROW(arr.access(0), IndexOutOfRange);
    EXPECT_THROW(arr.remove(0), IndexOutOfRange);
    EXPECT_THROW(arr.insert(1, 5), IndexOutOfRange);

    arr.insert(0, 5);
    EXPECT_THROW(arr.access(1), IndexOutOfRange);
    EXPECT_THROW(arr.update(1, 7), IndexOutOfRange);
    EXPECT_NO_THROW(arr.insert(1, 6));
}

TEST(array_test, errors_are_standard_exceptions) {
    Array<int> arr(1);
    arr.insert(0, 1);
    EXPECT_THROW(arr.insert(0, 2), std::length_error);
    EXPECT_THROW(arr.access(3), std::out_of_range);
}

TEST(array_test, update_replaces_in_place) {
    Array<int> arr(2);
    arr.insert(0, 1);
    arr.insert(1, 2);
    arr.update(1, 7);
    EXPECT_EQ(arr.access(1), 7);
    EXPECT_EQ(arr.size(), 2u);
    EXPECT_EQ(arr.capacity(), 2u);
}
