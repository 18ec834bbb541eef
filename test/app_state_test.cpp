#include <gtest/gtest.h>

#include "../src/db/sqlite.hpp"
#include "../src/app_state/state.hpp"
#include "test_utils.hpp"

static job_outcome_t outcome(const std::string &id, job_status_t status, std::optional<relay_error_t> error, unsigned long long bytes) {
    std::vector<destination_result_t> results;
    if (status == JOB_STATUS_COMPLETED) {
        results.push_back(destination_result_t { "page", true, std::nullopt, std::string("42") });
        results.push_back(destination_result_t { "archive", false, relay_error_t { RELAY_ERROR_DESTINATION_SESSION_FAILED, "denied" }, std::nullopt });
    }
    return job_outcome_t { id, std::string("Title ") + id, status, error, results, bytes };
}

TEST(app_state_test, basic_check) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    AppState state(db, true);
    const auto stats = state.get_stats();
    EXPECT_EQ(stats.total_jobs, 0);
    EXPECT_EQ(stats.successful_jobs, 0);
    EXPECT_EQ(stats.total_bytes, 0);
    EXPECT_GT(stats.started_at, 0);
    EXPECT_EQ(state.get_history().size(), 0);
}

TEST(app_state_test, records_outcomes) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    AppState state(db, true);
    state.record_outcome(outcome("a", JOB_STATUS_COMPLETED, std::nullopt, 1000));
    state.record_outcome(outcome("b", JOB_STATUS_FAILED, relay_error_t { RELAY_ERROR_SOURCE_UNAVAILABLE, "HTTP 404" }, 0));
    state.record_outcome(outcome("c", JOB_STATUS_FAILED, relay_error_t { RELAY_ERROR_CANCELLED, "" }, 0));
    state.add_duplicate_skipped();

    const auto stats = state.get_stats();
    EXPECT_EQ(stats.total_jobs, 3);
    EXPECT_EQ(stats.successful_jobs, 1);
    EXPECT_EQ(stats.failed_jobs, 1);
    EXPECT_EQ(stats.cancelled_jobs, 1);
    EXPECT_EQ(stats.total_bytes, 1000);
    EXPECT_EQ(stats.duplicates_skipped, 1);

    const auto history = state.get_history();
    ASSERT_EQ(history.size(), 3);
    EXPECT_EQ(history[0].source_id, "c");
    EXPECT_EQ(history[0].error, "Cancelled");
    EXPECT_EQ(history[1].source_id, "b");
    EXPECT_EQ(history[1].status, JOB_STATUS_FAILED);
    EXPECT_EQ(history[1].error, "SourceUnavailable: HTTP 404");
    EXPECT_EQ(history[2].source_id, "a");
    EXPECT_EQ(history[2].label, "Title a");
    EXPECT_EQ(history[2].status, JOB_STATUS_COMPLETED);
    EXPECT_EQ(history[2].destinations_succeeded, 1);
    EXPECT_EQ(history[2].destinations_total, 2);
    EXPECT_EQ(history[2].bytes, 1000);
    EXPECT_EQ(state.get_history(1).size(), 1);
}

TEST(app_state_test, counters_survive_reload) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    {
        AppState state(db, true);
        state.record_outcome(outcome("a", JOB_STATUS_COMPLETED, std::nullopt, 10));
    }
    AppState state(db, false);
    EXPECT_EQ(state.get_stats().total_jobs, 1);
    EXPECT_EQ(state.get_history().size(), 1);
}
