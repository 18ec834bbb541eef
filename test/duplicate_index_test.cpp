#include <filesystem>
#include <gtest/gtest.h>

#include "../src/db/sqlite.hpp"
#include "../src/duplicate_index/duplicate_index.hpp"
#include "test_utils.hpp"

TEST(duplicate_index_test, basic_check) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    DuplicateIndex index(db, true);
    EXPECT_EQ(index.size(), 0);
    EXPECT_FALSE(index.contains("a"));
    index.add("a");
    index.add("a");
    index.add("b");
    EXPECT_TRUE(index.contains("a"));
    EXPECT_TRUE(index.contains("b"));
    EXPECT_EQ(index.size(), 2);
    index.clear();
    EXPECT_FALSE(index.contains("a"));
    EXPECT_EQ(index.size(), 0);
}

TEST(duplicate_index_test, persists_across_reopen) {
    const auto db_path = (std::filesystem::path(get_tmp_dir()) / "duplicate_index" / "state.sqlite").string();
    std::filesystem::remove_all(std::filesystem::path(get_tmp_dir()) / "duplicate_index");
    {
        const auto maybe_db = db_open(db_path);
        ASSERT_TRUE(std::holds_alternative<std::shared_ptr<sqlite3>>(maybe_db));
        DuplicateIndex index(std::get<std::shared_ptr<sqlite3>>(maybe_db));
        index.add("https://source/video");
    }
    {
        const auto maybe_db = db_open(db_path);
        ASSERT_TRUE(std::holds_alternative<std::shared_ptr<sqlite3>>(maybe_db));
        DuplicateIndex index(std::get<std::shared_ptr<sqlite3>>(maybe_db));
        EXPECT_TRUE(index.contains("https://source/video"));
    }
    std::filesystem::remove_all(std::filesystem::path(get_tmp_dir()) / "duplicate_index");
}

TEST(duplicate_index_test, own_connection_survives_state_rollback) {
    const auto dir = std::filesystem::path(get_tmp_dir()) / "duplicate_index_rollback";
    const auto db_path = (dir / "state.sqlite").string();
    std::filesystem::remove_all(dir);
    {
        const auto maybe_state_db = db_open(db_path);
        ASSERT_TRUE(std::holds_alternative<std::shared_ptr<sqlite3>>(maybe_state_db));
        const auto maybe_index_db = db_open(db_path);
        ASSERT_TRUE(std::holds_alternative<std::shared_ptr<sqlite3>>(maybe_index_db));
        const auto state_db = std::get<std::shared_ptr<sqlite3>>(maybe_state_db);
        DuplicateIndex index(std::get<std::shared_ptr<sqlite3>>(maybe_index_db), true);

        db_exec(state_db, "BEGIN TRANSACTION");
        index.add("clip");
        db_exec(state_db, "ROLLBACK");
        EXPECT_TRUE(index.contains("clip"));

        DuplicateIndex reader(state_db);
        EXPECT_TRUE(reader.contains("clip"));
    }
    std::filesystem::remove_all(dir);
}
