#include "taildrive/client/local_store.hpp"
#include "taildrive/core/file_util.hpp"
#include "support/desktop_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using taildrive::client::LocalStore;
using taildrive::testing::create_temp_dir;

class LocalStoreTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = create_temp_dir("taildrive_store_test"); }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

TEST_F(LocalStoreTest, MissingFilesLoadEmpty) {
    LocalStore store(dir_);
    auto peers = store.load_peers();
    ASSERT_TRUE(peers.is_ok());
    EXPECT_TRUE(peers.value().empty());
    auto projects = store.load_projects();
    ASSERT_TRUE(projects.is_ok());
    EXPECT_TRUE(projects.value().empty());
}

TEST_F(LocalStoreTest, PeersReloadOffline) {
    taildrive::model::PeerInfo peer;
    peer.id = "n1";
    peer.hostname = "desk";
    peer.online = true;
    peer.ip_addresses = {"100.64.0.2"};

    LocalStore store(dir_);
    ASSERT_TRUE(store.save_peers({peer}).is_ok());

    auto loaded = store.load_peers();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].hostname, "desk");
    EXPECT_EQ(loaded.value()[0].ip_addresses.size(), 1u);
    EXPECT_FALSE(loaded.value()[0].online);
}

TEST_F(LocalStoreTest, ProjectsRoundTripThroughDisk) {
    taildrive::model::SyncProject project;
    project.id = "abc";
    project.local_path = "/desk/a.md";
    project.remote_path = "/phone/a.md";
    project.last_synced = 42;

    LocalStore store(dir_);
    ASSERT_TRUE(store.save_projects({project}).is_ok());
    EXPECT_TRUE(fs::exists(dir_ / "sync_projects.json"));

    auto loaded = LocalStore(dir_).load_projects();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].last_synced, 42u);
}

TEST_F(LocalStoreTest, CorruptFileIsAnError) {
    ASSERT_TRUE(taildrive::write_file(dir_ / "peers.json", std::string("{oops")).is_ok());
    EXPECT_TRUE(LocalStore(dir_).load_peers().is_error());
}

TEST_F(LocalStoreTest, EmptyDirectoryDisablesPersistence) {
    LocalStore store{fs::path()};
    EXPECT_TRUE(store.save_peers({}).is_ok());
    auto peers = store.load_peers();
    ASSERT_TRUE(peers.is_ok());
    EXPECT_TRUE(peers.value().empty());
}
