#include <ctime>
#include <stdexcept>

#include "./state.hpp"
#include "../db/sqlite.hpp"

#define STAT_TOTAL_JOBS "total_jobs"
#define STAT_SUCCESSFUL_JOBS "successful_jobs"
#define STAT_FAILED_JOBS "failed_jobs"
#define STAT_CANCELLED_JOBS "cancelled_jobs"
#define STAT_TOTAL_BYTES "total_bytes"
#define STAT_DUPLICATES_SKIPPED "duplicates_skipped"
#define STAT_STARTED_AT "started_at"

static void add_to_stat(std::shared_ptr<sqlite3> db, const char *name, long long value) {
    const auto update_query = std::string("UPDATE ") + RELAY_STATS_TABLE_NAME + " SET value=value+? WHERE name=?;";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), update_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare update statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    sqlite3_bind_int64(stmt, 1, value);
    sqlite3_bind_text(stmt, 2, name, -1, SQLITE_STATIC);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
}

AppState::AppState(std::shared_ptr<sqlite3> db_, bool reset) : db {db_} {
    if (reset) {
        db_exec(db, std::string("DROP TABLE IF EXISTS ") + JOB_HISTORY_TABLE_NAME + ";");
        db_exec(db, std::string("DROP TABLE IF EXISTS ") + RELAY_STATS_TABLE_NAME + ";");
    }
    db_exec(db, std::string("CREATE TABLE IF NOT EXISTS ") + JOB_HISTORY_TABLE_NAME +
        " (id INTEGER PRIMARY KEY AUTOINCREMENT, source_id TEXT NOT NULL, label TEXT, status INT NOT NULL, error TEXT,"
        " destinations_succeeded INT NOT NULL, destinations_total INT NOT NULL, bytes INT NOT NULL, finished_at INT NOT NULL);");
    db_exec(db, std::string("CREATE TABLE IF NOT EXISTS ") + RELAY_STATS_TABLE_NAME + " (name TEXT PRIMARY KEY, value INT NOT NULL);");

    const char *counters[] = {
        STAT_TOTAL_JOBS, STAT_SUCCESSFUL_JOBS, STAT_FAILED_JOBS, STAT_CANCELLED_JOBS, STAT_TOTAL_BYTES, STAT_DUPLICATES_SKIPPED
    };
    for (const auto counter : counters) {
        db_exec(db, std::string("INSERT OR IGNORE INTO ") + RELAY_STATS_TABLE_NAME + " (name, value) VALUES ('" + counter + "', 0);");
    }
    db_exec(db, std::string("INSERT OR IGNORE INTO ") + RELAY_STATS_TABLE_NAME + " (name, value) VALUES ('" + STAT_STARTED_AT + "', " +
        std::to_string((long long) std::time(nullptr)) + ");");
}

void AppState::record_outcome(const job_outcome_t &outcome) {
    unsigned int succeeded = 0;
    for (const auto &r : outcome.results) {
        if (r.success) {
            succeeded++;
        }
    }
    const auto label = outcome.label.value_or("");
    const auto error = outcome.error.has_value() ? describe_error(outcome.error.value()) : std::string();
    const auto cancelled = outcome.error.has_value() && outcome.error->kind == RELAY_ERROR_CANCELLED;

    db_exec(db, "BEGIN TRANSACTION");
    try {
        const auto insert_query = std::string("INSERT INTO ") + JOB_HISTORY_TABLE_NAME +
            " (source_id, label, status, error, destinations_succeeded, destinations_total, bytes, finished_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        auto rc = sqlite3_prepare_v2(db.get(), insert_query.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db.get())));
        }
        sqlite3_bind_text(stmt, 1, outcome.source_id.c_str(), outcome.source_id.size(), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, label.c_str(), label.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, outcome.status);
        sqlite3_bind_text(stmt, 4, error.c_str(), error.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 5, succeeded);
        sqlite3_bind_int(stmt, 6, (int) outcome.results.size());
        sqlite3_bind_int64(stmt, 7, (sqlite3_int64) outcome.bytes_transferred);
        sqlite3_bind_int64(stmt, 8, (sqlite3_int64) std::time(nullptr));
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
        }

        add_to_stat(db, STAT_TOTAL_JOBS, 1);
        if (outcome.status == JOB_STATUS_COMPLETED) {
            add_to_stat(db, STAT_SUCCESSFUL_JOBS, 1);
            add_to_stat(db, STAT_TOTAL_BYTES, (long long) outcome.bytes_transferred);
        } else if (cancelled) {
            add_to_stat(db, STAT_CANCELLED_JOBS, 1);
        } else {
            add_to_stat(db, STAT_FAILED_JOBS, 1);
        }
    } catch (const std::exception &) {
        sqlite3_exec(db.get(), "ROLLBACK TRANSACTION", nullptr, nullptr, nullptr);
        throw;
    }
    db_exec(db, "COMMIT TRANSACTION");
}

void AppState::add_duplicate_skipped() {
    add_to_stat(db, STAT_DUPLICATES_SKIPPED, 1);
}

relay_stats_t AppState::get_stats() const {
    relay_stats_t stats {};
    const auto select_query = std::string("SELECT name, value FROM ") + RELAY_STATS_TABLE_NAME + ";";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), select_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    while (true) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
        }
        const auto name = std::string(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
        const auto value = sqlite3_column_int64(stmt, 1);
        if (name == STAT_TOTAL_JOBS) {
            stats.total_jobs = value;
        } else if (name == STAT_SUCCESSFUL_JOBS) {
            stats.successful_jobs = value;
        } else if (name == STAT_FAILED_JOBS) {
            stats.failed_jobs = value;
        } else if (name == STAT_CANCELLED_JOBS) {
            stats.cancelled_jobs = value;
        } else if (name == STAT_TOTAL_BYTES) {
            stats.total_bytes = value;
        } else if (name == STAT_DUPLICATES_SKIPPED) {
            stats.duplicates_skipped = value;
        } else if (name == STAT_STARTED_AT) {
            stats.started_at = value;
        }
    }
    sqlite3_finalize(stmt);
    return stats;
}

static std::string column_string(sqlite3_stmt *stmt, int column) {
    const auto ptr = sqlite3_column_text(stmt, column);
    if (ptr == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char *>(ptr));
}

std::vector<job_history_entry_t> AppState::get_history(size_t limit) const {
    const auto select_query = std::string("SELECT source_id, label, status, error, destinations_succeeded, destinations_total, bytes, finished_at FROM ") +
        JOB_HISTORY_TABLE_NAME + " ORDER BY id DESC LIMIT ?;";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), select_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    sqlite3_bind_int64(stmt, 1, (sqlite3_int64) limit);
    std::vector<job_history_entry_t> ret;
    while (true) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
        }
        job_history_entry_t entry;
        entry.source_id = column_string(stmt, 0);
        entry.label = column_string(stmt, 1);
        entry.status = static_cast<job_status_t>(sqlite3_column_int(stmt, 2));
        entry.error = column_string(stmt, 3);
        entry.destinations_succeeded = (unsigned int) sqlite3_column_int(stmt, 4);
        entry.destinations_total = (unsigned int) sqlite3_column_int(stmt, 5);
        entry.bytes = (unsigned long long) sqlite3_column_int64(stmt, 6);
        entry.finished_at = sqlite3_column_int64(stmt, 7);
        ret.push_back(entry);
    }
    sqlite3_finalize(stmt);
    return ret;
}
