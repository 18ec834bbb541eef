#pragma once

#include <memory>
#include <string>

#include <sqlite3.h>

#define RELAYED_SOURCES_TABLE_NAME "relayed_sources"

// Persisted set of source ids that reached at least one destination.
// Append-only apart from clear().
// NOTE: DuplicateIndex is not thread-safe, JobQueue guards it
class DuplicateIndex {
  public:
    DuplicateIndex(std::shared_ptr<sqlite3> db_, bool reset = false);

    bool contains(const std::string &source_id) const;
    // no-op for an id already present
    void add(const std::string &source_id);
    void clear();
    size_t size() const;

  private:
    std::shared_ptr<sqlite3> db;
};
