#pragma once

#include <chrono>

// download cadence
#define DOWNLOAD_MIN_INTERVAL_MS 3000
#define DOWNLOAD_MAX_INTERVAL_MS 10000
// uploads multiplex over destinations and share one reporting channel
#define UPLOAD_MIN_INTERVAL_MS 5000
#define UPLOAD_MAX_INTERVAL_MS 15000

typedef std::chrono::steady_clock::time_point progress_time_t;

struct throttle_window_t {
    std::chrono::milliseconds min_interval;
    std::chrono::milliseconds max_interval;
};

throttle_window_t download_window();
throttle_window_t upload_window();

// Decides whether a progress event of one transfer should be surfaced.
// Emits on a percent change once min_interval passed, or unconditionally
// once max_interval passed. The first call always emits.
class ProgressThrottle {
  public:
    explicit ProgressThrottle(throttle_window_t window_);

    bool should_emit(int percent, progress_time_t now);

  private:
    throttle_window_t window;
    int last_percent;
    progress_time_t last_emitted_at;
    bool emitted_once;
};
