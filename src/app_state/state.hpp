#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h>
#include "../job_queue/job.hpp"

#define JOB_HISTORY_TABLE_NAME "job_history"
#define RELAY_STATS_TABLE_NAME "relay_stats"

struct relay_stats_t {
    unsigned long long total_jobs;
    unsigned long long successful_jobs;
    unsigned long long failed_jobs;
    unsigned long long cancelled_jobs;
    unsigned long long total_bytes;
    unsigned long long duplicates_skipped;
    // unix time of the first run against this state file
    long long started_at;
};

struct job_history_entry_t {
    std::string source_id;
    std::string label;
    job_status_t status;
    // describe_error() of the job-level error, empty on success
    std::string error;
    unsigned int destinations_succeeded;
    unsigned int destinations_total;
    unsigned long long bytes;
    long long finished_at;
};

// NOTE: AppState is not thread-safe

class AppState {
public:
    AppState(std::shared_ptr<sqlite3> db_, bool reset = false);

    // appends to the history and updates the counters
    void record_outcome(const job_outcome_t &outcome);
    void add_duplicate_skipped();

    relay_stats_t get_stats() const;
    // newest first
    std::vector<job_history_entry_t> get_history(size_t limit = 20) const;

private:
    std::shared_ptr<sqlite3> db;
};
