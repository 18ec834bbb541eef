#pragma once

#include <string>

enum relay_error_kind_t {
    // resolver or fetch failed before any byte was received
    RELAY_ERROR_SOURCE_UNAVAILABLE = 0,
    // stream broke after the transfer started
    RELAY_ERROR_DOWNLOAD_FAILED = 1,
    // operator cancelled the download, never retried
    RELAY_ERROR_CANCELLED = 2,
    // start, transfer or finish failed for one destination
    RELAY_ERROR_DESTINATION_SESSION_FAILED = 3,
    // optional asset could not be attached, even without it the finish failed
    RELAY_ERROR_SECONDARY_ARTIFACT_FAILED = 4,
    // every destination of the job failed
    RELAY_ERROR_ALL_DESTINATIONS_FAILED = 5
};

struct relay_error_t {
    relay_error_kind_t kind;
    std::string message;
};

const char *relay_error_name(relay_error_kind_t kind);

// "Kind: message" form used in logs and job history
std::string describe_error(const relay_error_t &error);
