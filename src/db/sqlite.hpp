#pragma once

#include <memory>
#include <string>
#include <variant>

#include <sqlite3.h>

#define DB_BUSY_TIMEOUT_MS 5000

// creates missing parent directories, ":memory:" opens a private in-memory database
std::variant<std::shared_ptr<sqlite3>, std::string> db_open(const std::string &path);

// runs a statement without results, throws std::runtime_error on failure
void db_exec(const std::shared_ptr<sqlite3> &db, const std::string &query);
