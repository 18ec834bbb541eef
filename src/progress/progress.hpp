#pragma once

#include <string>
#include <optional>
#include <functional>

enum progress_phase_t {
    PROGRESS_PHASE_DOWNLOAD = 0,
    PROGRESS_PHASE_UPLOAD = 1
};

struct progress_event_t {
    std::string source_id;
    progress_phase_t phase;
    int percent;
    unsigned long long bytes_transferred;
    unsigned long long total_bytes;
    std::optional<double> rate_bytes_per_second;
    // set for upload events
    std::optional<std::string> destination_label;
    bool paused;
};

// Receives surfaced progress events. Delivery is best-effort: a sink may
// throw (rate limited reporting channel) and the transfer keeps going.
typedef std::function<void(const progress_event_t &)> progress_sink_t;

// calls the sink and swallows delivery failures
void deliver_progress(const progress_sink_t &sink, const progress_event_t &event);

// integer percent, 0 when the total is not known yet
int progress_percent(unsigned long long done, unsigned long long total);

std::string format_bytes(unsigned long long bytes);

std::string format_progress(const progress_event_t &event);
