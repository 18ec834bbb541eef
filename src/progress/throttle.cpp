#include "./throttle.hpp"

throttle_window_t download_window() {
    return throttle_window_t {
        std::chrono::milliseconds(DOWNLOAD_MIN_INTERVAL_MS),
        std::chrono::milliseconds(DOWNLOAD_MAX_INTERVAL_MS)
    };
}

throttle_window_t upload_window() {
    return throttle_window_t {
        std::chrono::milliseconds(UPLOAD_MIN_INTERVAL_MS),
        std::chrono::milliseconds(UPLOAD_MAX_INTERVAL_MS)
    };
}

ProgressThrottle::ProgressThrottle(throttle_window_t window_) :
    window {window_},
    last_percent {-1},
    last_emitted_at {},
    emitted_once {false} {}

bool ProgressThrottle::should_emit(int percent, progress_time_t now) {
    bool emit = false;
    if (!emitted_once) {
        emit = true;
    } else {
        const auto elapsed = now - last_emitted_at;
        emit = (percent != last_percent && elapsed >= window.min_interval) || elapsed >= window.max_interval;
    }
    if (emit) {
        last_percent = percent;
        last_emitted_at = now;
        emitted_once = true;
    }
    return emit;
}
