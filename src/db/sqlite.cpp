#include <stdexcept>
#include <filesystem>

#include "./sqlite.hpp"

std::variant<std::shared_ptr<sqlite3>, std::string> db_open(const std::string &path) {
    sqlite3 *db_raw = nullptr;
    if (path != ":memory:") {
        const auto parent_path = std::filesystem::path(path).parent_path();
        std::error_code ec;
        if (!parent_path.empty() && !std::filesystem::exists(parent_path)) {
            std::filesystem::create_directories(parent_path, ec);
            if (ec) {
                return "Could not create directory " + parent_path.string() + ": " + ec.message();
            }
        }
    }
    const auto db_open_ret = sqlite3_open_v2(path.c_str(), &db_raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (db_open_ret != SQLITE_OK) {
        const auto error = std::string(db_raw == nullptr ? sqlite3_errstr(db_open_ret) : sqlite3_errmsg(db_raw));
        sqlite3_close(db_raw);
        return error;
    }
    std::shared_ptr<sqlite3> db(nullptr);
    db.reset(db_raw, sqlite3_close);
    sqlite3_busy_timeout(db.get(), DB_BUSY_TIMEOUT_MS);
    return db;
}

void db_exec(const std::shared_ptr<sqlite3> &db, const std::string &query) {
    char *err_msg = nullptr;
    const auto rc = sqlite3_exec(db.get(), query.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        const auto err_msg_str = err_msg == nullptr ? std::string(sqlite3_errstr(rc)) : std::string(err_msg);
        sqlite3_free(err_msg);
        throw std::runtime_error("Failed to execute \"" + query + "\": " + err_msg_str);
    }
}
