#include <thread>
#include <chrono>
#include <string>
#include <gtest/gtest.h>

#include "../src/deque/deque.hpp"

TEST(deque_test, fifo) {
    ThreadSafeDeque<std::string> deque;
    EXPECT_TRUE(deque.empty());
    deque.push_back("first");
    deque.push_back("second");
    EXPECT_EQ(deque.size(), 2);
    EXPECT_EQ(deque.pop_front_waiting(), "first");
    EXPECT_EQ(deque.try_pop_front(), "second");
    EXPECT_EQ(deque.try_pop_front(), std::nullopt);
}

TEST(deque_test, waiting_for_times_out) {
    ThreadSafeDeque<int> deque;
    const auto value = deque.pop_front_waiting_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(value.has_value());
}

TEST(deque_test, wakes_waiting_consumer) {
    ThreadSafeDeque<int> deque;
    std::thread producer([&deque] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        deque.push_back(7);
    });
    const auto value = deque.pop_front_waiting_for(std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 7);
}
