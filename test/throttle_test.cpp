#include <vector>
#include <gtest/gtest.h>

#include "../src/progress/throttle.hpp"

using namespace std::chrono;

TEST(throttle_test, first_call_emits) {
    ProgressThrottle throttle(download_window());
    const auto now = steady_clock::now();
    EXPECT_TRUE(throttle.should_emit(0, now));
    EXPECT_FALSE(throttle.should_emit(0, now));
    EXPECT_FALSE(throttle.should_emit(5, now + milliseconds(100)));
}

TEST(throttle_test, emits_on_change_after_min_interval) {
    ProgressThrottle throttle(download_window());
    const auto start = steady_clock::now();
    EXPECT_TRUE(throttle.should_emit(1, start));
    EXPECT_FALSE(throttle.should_emit(2, start + milliseconds(DOWNLOAD_MIN_INTERVAL_MS - 1)));
    EXPECT_TRUE(throttle.should_emit(2, start + milliseconds(DOWNLOAD_MIN_INTERVAL_MS)));
    // same percent is held back until the max interval
    EXPECT_FALSE(throttle.should_emit(2, start + milliseconds(DOWNLOAD_MIN_INTERVAL_MS * 2)));
}

TEST(throttle_test, emits_unchanged_after_max_interval) {
    ProgressThrottle throttle(download_window());
    const auto start = steady_clock::now();
    unsigned int emitted = 0;
    // a stalled transfer polled every 200 ms for 30 s
    for (int t = 0; t <= 30000; t += 200) {
        if (throttle.should_emit(40, start + milliseconds(t))) {
            emitted++;
        }
    }
    // at 0, 10 s, 20 s and 30 s
    EXPECT_EQ(emitted, 4);
}

TEST(throttle_test, steady_progress_respects_window) {
    ProgressThrottle throttle(download_window());
    const auto start = steady_clock::now();
    std::vector<int> emitted_at;
    // 1 % every 200 ms
    for (int step = 0; step <= 100; step++) {
        const auto t = step * 200;
        if (throttle.should_emit(step, start + milliseconds(t))) {
            emitted_at.push_back(t);
        }
    }
    ASSERT_GE(emitted_at.size(), 2);
    EXPECT_EQ(emitted_at[0], 0);
    for (size_t i = 1; i < emitted_at.size(); i++) {
        const auto gap = emitted_at[i] - emitted_at[i - 1];
        EXPECT_GE(gap, DOWNLOAD_MIN_INTERVAL_MS);
        EXPECT_LE(gap, DOWNLOAD_MAX_INTERVAL_MS);
    }
}

TEST(throttle_test, upload_window_is_wider) {
    ProgressThrottle throttle(upload_window());
    const auto start = steady_clock::now();
    EXPECT_TRUE(throttle.should_emit(10, start));
    EXPECT_FALSE(throttle.should_emit(20, start + milliseconds(DOWNLOAD_MIN_INTERVAL_MS)));
    EXPECT_TRUE(throttle.should_emit(20, start + milliseconds(UPLOAD_MIN_INTERVAL_MS)));
    EXPECT_TRUE(throttle.should_emit(20, start + milliseconds(UPLOAD_MIN_INTERVAL_MS + UPLOAD_MAX_INTERVAL_MS)));
}
