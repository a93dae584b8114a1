#include "taildrive/client/sync_client.hpp"
#include "taildrive/core/file_util.hpp"
#include "support/desktop_fixture.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace fs = std::filesystem;
using namespace taildrive;
using namespace taildrive::client;
using namespace std::chrono_literals;

class SyncClientTest : public ::testing::Test {
protected:
    SyncClientTest() : desk_("taildrive_client_test") {}

    ClientConfig make_config() {
        ClientConfig config;
        config.server_url = "http://desk.test:8080";
        config.storage_dir = desk_.root / "phone_store";
        config.save_directory = desk_.root / "saved";
        config.poll_interval_ms = 50;
        config.tick_ms = 10;
        return config;
    }

    TransportFactory loopback_factory() {
        return [this](const std::string& url) -> Result<std::shared_ptr<network::HttpTransport>> {
            urls_.push_back(url);
            return Ok(std::shared_ptr<network::HttpTransport>(desk_.transport));
        };
    }

    // Processes events until `done` holds or the deadline passes
    template<typename Pred>
    bool pump_until(SyncClient& client, Pred done, std::chrono::milliseconds limit = 3000ms) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            client.process_events();
            if (done()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    taildrive::testing::DesktopHarness desk_;
    std::vector<std::string> urls_;
};

TEST_F(SyncClientTest, ConnectsAndReflectsStatus) {
    desk_.state.received.record(model::InboundFile{"hello.txt", std::nullopt, 5, "phone"});
    SyncClient client(make_config(), loopback_factory());
    EXPECT_EQ(client.state().status_message, "Connecting...");

    ASSERT_TRUE(client.start().is_ok());
    EXPECT_TRUE(client.is_running());
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().connected; }));
    EXPECT_EQ(client.state().status_message, "Connected to server");
    EXPECT_EQ(client.state().last_received_file, std::optional<std::string>("hello.txt"));
    ASSERT_EQ(urls_.size(), 1u);
    EXPECT_EQ(urls_[0], "http://desk.test:8080");
    client.stop();
    EXPECT_FALSE(client.is_running());
}

TEST_F(SyncClientTest, DownloadSavesAndQueuesShare) {
    desk_.backend.inbox["doc.pdf"] = std::vector<uint8_t>(2048, 'd');
    SyncClient client(make_config(), loopback_factory());
    ASSERT_TRUE(client.start().is_ok());

    client.download_file("doc.pdf");
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().download_status.has_value(); }));
    EXPECT_EQ(*client.state().download_status, "✓ Saved 'doc.pdf' (2.00 KB)");

    ASSERT_TRUE(client.has_pending_share());
    const std::string shared = client.consume_pending_share_path();
    EXPECT_EQ(fs::path(shared), desk_.root / "saved" / "doc.pdf");
    EXPECT_EQ(fs::file_size(shared), 2048u);
    EXPECT_EQ(client.consume_pending_share_path(), "");
}

TEST_F(SyncClientTest, DownloadWithoutSaveDirectory) {
    desk_.backend.inbox["a.bin"] = {1, 2, 3};
    auto config = make_config();
    config.save_directory.clear();
    SyncClient client(config, loopback_factory());
    ASSERT_TRUE(client.start().is_ok());

    client.download_file("a.bin");
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().download_status.has_value(); }));
    EXPECT_EQ(*client.state().download_status, "✓ Downloaded 'a.bin' (3 B), no save directory set");
    EXPECT_FALSE(client.has_pending_share());
}

TEST_F(SyncClientTest, ErrorsSurfaceInDownloadStatus) {
    SyncClient client(make_config(), loopback_factory());
    ASSERT_TRUE(client.start().is_ok());

    client.download_last();
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().download_status.has_value(); }));
    EXPECT_EQ(client.state().download_status->rfind("✗ ", 0), 0u);
}

TEST_F(SyncClientTest, BrowseAndPull) {
    ASSERT_TRUE(write_file(desk_.desktop_dir / "a.txt", std::string("aaa")).is_ok());
    ASSERT_TRUE(write_file(desk_.desktop_dir / "b.txt", std::string("bbb")).is_ok());
    SyncClient client(make_config(), loopback_factory());
    ASSERT_TRUE(client.start().is_ok());

    client.browse();
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().remote_files.size() == 2; }));
    EXPECT_EQ(*client.state().browse_status, "Found 2 items");

    client.pull_file((desk_.desktop_dir / "b.txt").string());
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().browse_status->rfind("✓", 0) == 0; }));
    EXPECT_TRUE(fs::exists(desk_.root / "saved" / "b.txt"));
}

TEST_F(SyncClientTest, UploadStatus) {
    const auto phone_file = desk_.mobile_dir / "voice.m4a";
    ASSERT_TRUE(write_file(phone_file, std::string("audio")).is_ok());
    SyncClient client(make_config(), loopback_factory());
    ASSERT_TRUE(client.start().is_ok());

    client.upload_file(phone_file.string(), std::string("memos/voice.m4a"));
    ASSERT_TRUE(pump_until(client, [&]() { return client.state().upload_status.has_value(); }));
    EXPECT_EQ(*client.state().upload_status, "✓ Uploaded 'voice.m4a' to memos/voice.m4a");
}

TEST_F(SyncClientTest, ReconnectKeepsPeersOffline) {
    model::PeerInfo tablet;
    tablet.id = "tablet";
    tablet.hostname = "tablet";
    tablet.online = true;
    desk_.state.peers.replace({tablet});

    SyncClient client(make_config(), loopback_factory());
    client.set_save_directory(desk_.root / "elsewhere");
    ASSERT_TRUE(client.start().is_ok());
    ASSERT_TRUE(pump_until(client, [&]() { return !client.state().peers.empty(); }));

    desk_.transport->reachable = false;
    ASSERT_TRUE(client.reconnect("http://other.test:9000").is_ok());
    EXPECT_EQ(client.state().server_url, "http://other.test:9000");
    EXPECT_FALSE(client.state().connected);
    ASSERT_EQ(client.state().peers.size(), 1u);
    EXPECT_FALSE(client.state().peers[0].online);
    EXPECT_EQ(client.save_directory(), desk_.root / "elsewhere");
    ASSERT_EQ(urls_.size(), 2u);
    EXPECT_EQ(urls_[1], "http://other.test:9000");

    ASSERT_TRUE(pump_until(client, [&]() { return client.state().status_message == "Cannot reach server"; }));
    EXPECT_EQ(client.state().peers.size(), 1u);
}

TEST_F(SyncClientTest, CachedPeersLoadedOnStart) {
    model::PeerInfo laptop;
    laptop.id = "laptop";
    laptop.online = true;
    ASSERT_TRUE(LocalStore(desk_.root / "phone_store").save_peers({laptop}).is_ok());
    desk_.transport->reachable = false;

    SyncClient client(make_config(), loopback_factory());
    ASSERT_TRUE(client.start().is_ok());
    ASSERT_EQ(client.state().peers.size(), 1u);
    EXPECT_FALSE(client.state().peers[0].online);
}

TEST_F(SyncClientTest, FactoryFailurePreventsStart) {
    SyncClient client(make_config(), [](const std::string& url) -> Result<std::shared_ptr<network::HttpTransport>> {
        return Err("bad url " + url);
    });
    EXPECT_TRUE(client.start().is_error());
    EXPECT_FALSE(client.is_running());
    EXPECT_EQ(client.process_events(), 0u);
}

TEST_F(SyncClientTest, DefaultFactoryRejectsBadScheme) {
    auto config = make_config();
    config.server_url = "ftp://desk";
    SyncClient client(config);
    EXPECT_TRUE(client.start().is_error());
}

TEST(FormatTest, Sizes) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1536), "1.50 KB");
    EXPECT_EQ(format_size(3 * 1024 * 1024), "3.00 MB");
    EXPECT_EQ(format_size(1342177280ULL), "1.25 GB");
    EXPECT_EQ(format_size(1024ULL * 1024 * 1024), "1.00 GB");
    EXPECT_EQ(format_size(5ULL * 1024 * 1024 * 1024 * 1024), "5120.00 GB");
}

TEST(FormatTest, Timestamps) {
    const uint64_t now = 1700000000;
    EXPECT_EQ(format_timestamp(0, now), "Unknown");
    EXPECT_EQ(format_timestamp(now - 30, now), "Just now");
    EXPECT_EQ(format_timestamp(now + 100, now), "Just now");
    EXPECT_EQ(format_timestamp(now - 300, now), "5 min ago");
    EXPECT_EQ(format_timestamp(now - 7200, now), "2 hr ago");
    EXPECT_EQ(format_timestamp(now - 3 * 86400, now), "3 days ago");
}
