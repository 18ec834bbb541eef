#include <ctime>
#include <stdexcept>

#include "./duplicate_index.hpp"
#include "../db/sqlite.hpp"

DuplicateIndex::DuplicateIndex(std::shared_ptr<sqlite3> db_, bool reset) : db {db_} {
    if (reset) {
        db_exec(db, std::string("DROP TABLE IF EXISTS ") + RELAYED_SOURCES_TABLE_NAME + ";");
    }
    db_exec(db, std::string("CREATE TABLE IF NOT EXISTS ") + RELAYED_SOURCES_TABLE_NAME + " (source_id TEXT PRIMARY KEY, relayed_at INT NOT NULL);");
}

bool DuplicateIndex::contains(const std::string &source_id) const {
    const auto select_query = std::string("SELECT 1 FROM ") + RELAYED_SOURCES_TABLE_NAME + " WHERE source_id=?;";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), select_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    sqlite3_bind_text(stmt, 1, source_id.c_str(), source_id.size(), SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return false;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
    return true;
}

void DuplicateIndex::add(const std::string &source_id) {
    const auto insert_query = std::string("INSERT OR IGNORE INTO ") + RELAYED_SOURCES_TABLE_NAME + " (source_id, relayed_at) VALUES (?, ?);";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), insert_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    sqlite3_bind_text(stmt, 1, source_id.c_str(), source_id.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, (sqlite3_int64) std::time(nullptr));
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
}

void DuplicateIndex::clear() {
    db_exec(db, std::string("DELETE FROM ") + RELAYED_SOURCES_TABLE_NAME + ";");
}

size_t DuplicateIndex::size() const {
    const auto count_query = std::string("SELECT COUNT(*) FROM ") + RELAYED_SOURCES_TABLE_NAME + ";";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), count_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to step: " + std::string(sqlite3_errmsg(db.get())));
    }
    const auto count = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return (size_t) count;
}
