#include <cstdio>
#include <exception>

#include "./progress.hpp"

void deliver_progress(const progress_sink_t &sink, const progress_event_t &event) {
    if (!sink) {
        return;
    }
    try {
        sink(event);
    } catch (const std::exception &e) {
        // lost UI update, not a transfer failure
        fprintf(stderr, "Progress update for \"%s\" dropped: %s\n", event.source_id.c_str(), e.what());
    }
}

int progress_percent(unsigned long long done, unsigned long long total) {
    if (total == 0) {
        return 0;
    }
    if (done >= total) {
        return 100;
    }
    return (int) (done * 100 / total);
}

std::string format_bytes(unsigned long long bytes) {
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = (double) bytes;
    unsigned int unit = 0;
    while (value >= 1024 && unit < 4) {
        value /= 1024;
        unit++;
    }
    char buf[32];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%llu B", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    }
    return buf;
}

std::string format_progress(const progress_event_t &event) {
    std::string line = event.phase == PROGRESS_PHASE_DOWNLOAD ? "Downloading" : "Uploading";
    if (event.destination_label.has_value()) {
        line += " to " + event.destination_label.value();
    }
    line += " " + std::to_string(event.percent) + "% (" + format_bytes(event.bytes_transferred);
    if (event.total_bytes > 0) {
        line += " / " + format_bytes(event.total_bytes);
    }
    line += ")";
    if (event.rate_bytes_per_second.has_value()) {
        line += " " + format_bytes((unsigned long long) event.rate_bytes_per_second.value()) + "/s";
    }
    if (event.paused) {
        line += " [paused]";
    }
    return line;
}
