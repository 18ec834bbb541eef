#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <optional>

#include "../errors/errors.hpp"
#include "../uploader/uploader.hpp"

enum job_status_t {
    JOB_STATUS_PENDING = 0,
    JOB_STATUS_PROCESSING = 1,
    JOB_STATUS_COMPLETED = 2,
    JOB_STATUS_FAILED = 3
};

struct job_t {
    std::string source_id;
    std::string locator;
    // ordered, non-empty, fixed at admission
    std::vector<std::string> destinations;
    job_status_t status;
    // unset until the source is resolved, unless given at admission
    std::optional<std::string> label;
    std::chrono::system_clock::time_point created_at;
};

struct job_outcome_t {
    std::string source_id;
    std::optional<std::string> label;
    // JOB_STATUS_COMPLETED or JOB_STATUS_FAILED
    job_status_t status;
    std::optional<relay_error_t> error;
    // in destination order, empty when no destination was attempted
    std::vector<destination_result_t> results;
    unsigned long long bytes_transferred;
};

const char *job_status_name(job_status_t status);
