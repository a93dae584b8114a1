#include "taildrive/server/sync_project_table.hpp"
#include "taildrive/core/file_util.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using taildrive::testing::create_temp_dir;
using taildrive::server::SyncProjectTable;
using taildrive::server::TableError;

class SyncProjectTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir("taildrive_table_test");
        store_ = dir_ / "config" / "sync_projects.json";
        desktop_file_ = dir_ / "notes.md";
        ASSERT_TRUE(taildrive::write_file(desktop_file_, std::string("# notes")).is_ok());
        ASSERT_TRUE(taildrive::set_file_mtime(desktop_file_, 1700000000).is_ok());
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
    fs::path store_;
    fs::path desktop_file_;
};

TEST_F(SyncProjectTableTest, CreatePersistsAndReloads) {
    SyncProjectTable table(store_);
    ASSERT_TRUE(table.load().is_ok());
    EXPECT_EQ(table.size(), 0u);

    auto created = table.create(desktop_file_.string(), "/sdcard/notes.md");
    ASSERT_TRUE(created.is_ok());
    EXPECT_EQ(created.value().id.size(), 16u);
    EXPECT_EQ(created.value().id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(created.value().last_synced, 0u);
    EXPECT_FALSE(created.value().paused);
    EXPECT_TRUE(fs::exists(store_));

    SyncProjectTable reloaded(store_);
    ASSERT_TRUE(reloaded.load().is_ok());
    auto projects = reloaded.list();
    ASSERT_EQ(projects.size(), 1u);
    EXPECT_EQ(projects[0].id, created.value().id);
    EXPECT_EQ(projects[0].local_path, desktop_file_.string());
    EXPECT_EQ(projects[0].remote_path, "/sdcard/notes.md");
}

TEST_F(SyncProjectTableTest, IdsAreUnique) {
    SyncProjectTable table(store_);
    auto a = table.create("/a", "/m/a");
    auto b = table.create("/b", "/m/b");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value().id, b.value().id);
}

TEST_F(SyncProjectTableTest, EmptyPathsRejected) {
    SyncProjectTable table(store_);
    auto created = table.create("", "/m/a");
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, TableError::Kind::InvalidArgument);
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(SyncProjectTableTest, RemoveUnknownLeavesTableUnchanged) {
    SyncProjectTable table(store_);
    ASSERT_TRUE(table.create(desktop_file_.string(), "/m/notes.md").is_ok());

    auto removed = table.remove("does-not-exist");
    ASSERT_TRUE(removed.is_error());
    EXPECT_EQ(removed.error().kind, TableError::Kind::NotFound);
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(SyncProjectTableTest, RemoveKnownProject) {
    SyncProjectTable table(store_);
    auto created = table.create(desktop_file_.string(), "/m/notes.md");
    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(table.remove(created.value().id).is_ok());
    EXPECT_EQ(table.size(), 0u);

    SyncProjectTable reloaded(store_);
    ASSERT_TRUE(reloaded.load().is_ok());
    EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(SyncProjectTableTest, AcknowledgeIsMonotonicAndIdempotent) {
    SyncProjectTable table(store_);
    auto created = table.create(desktop_file_.string(), "/m/notes.md");
    ASSERT_TRUE(created.is_ok());
    const auto id = created.value().id;

    auto first = table.acknowledge(id, 500);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().last_synced, 500u);

    auto again = table.acknowledge(id, 500);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().last_synced, 500u);

    auto older = table.acknowledge(id, 100);
    ASSERT_TRUE(older.is_ok());
    EXPECT_EQ(older.value().last_synced, 500u);

    EXPECT_TRUE(table.acknowledge("unknown", 900).is_error());
}

TEST_F(SyncProjectTableTest, CheckReportsNewerDesktopFile) {
    SyncProjectTable table(store_);
    auto created = table.create(desktop_file_.string(), "/m/notes.md");
    ASSERT_TRUE(created.is_ok());

    auto changes = table.check();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].id, created.value().id);
    EXPECT_EQ(changes[0].local_path, desktop_file_.string());
    EXPECT_EQ(changes[0].remote_path, "/m/notes.md");
    EXPECT_EQ(changes[0].new_modified, 1700000000u);

    ASSERT_TRUE(table.acknowledge(created.value().id, 1700000000).is_ok());
    EXPECT_TRUE(table.check().empty());

    ASSERT_TRUE(taildrive::set_file_mtime(desktop_file_, 1700000100).is_ok());
    changes = table.check();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].new_modified, 1700000100u);
}

TEST_F(SyncProjectTableTest, CheckSkipsPausedAndMissing) {
    SyncProjectTable table(store_);
    auto paused = table.create(desktop_file_.string(), "/m/notes.md");
    ASSERT_TRUE(paused.is_ok());
    ASSERT_TRUE(table.create((dir_ / "gone.txt").string(), "/m/gone.txt").is_ok());

    auto updated = table.set_paused(paused.value().id, true);
    ASSERT_TRUE(updated.is_ok());
    EXPECT_TRUE(updated.value().paused);
    EXPECT_TRUE(table.check().empty());

    ASSERT_TRUE(table.set_paused(paused.value().id, false).is_ok());
    EXPECT_EQ(table.check().size(), 1u);
}

TEST_F(SyncProjectTableTest, PersistFailureRollsBack) {
    // A directory where the store file should be makes every write fail
    fs::create_directories(store_);
    SyncProjectTable table(store_);

    auto created = table.create(desktop_file_.string(), "/m/notes.md");
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, TableError::Kind::Storage);
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(SyncProjectTableTest, CorruptStoreFailsToLoad) {
    ASSERT_TRUE(taildrive::write_file(store_, std::string("{not json")).is_ok());
    SyncProjectTable table(store_);
    EXPECT_TRUE(table.load().is_error());
}

TEST_F(SyncProjectTableTest, InMemoryTableNeverTouchesDisk) {
    SyncProjectTable table{fs::path()};
    ASSERT_TRUE(table.load().is_ok());
    ASSERT_TRUE(table.create("/a", "/b").is_ok());
    EXPECT_EQ(table.size(), 1u);
}
