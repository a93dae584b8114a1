#include "taildrive/server/backend_monitor.hpp"
#include "taildrive/server/file_sender.hpp"
#include "taildrive/server/inbound_watcher.hpp"
#include "taildrive/core/file_util.hpp"
#include "support/fake_backend.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace taildrive;
using namespace taildrive::server;
using namespace std::chrono_literals;

namespace {

model::PeerInfo make_peer(const std::string& id, bool is_self) {
    model::PeerInfo peer;
    peer.id = id;
    peer.hostname = id;
    peer.online = true;
    peer.os = "linux";
    peer.is_self = is_self;
    return peer;
}

template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

// Holds each push until release() hands out a permit
class GatedBackend : public taildrive::testing::FakeBackend {
public:
    server::BackendResult<void> push_file(const std::string& peer_id,
                                          const std::filesystem::path& path) override {
        {
            std::unique_lock<std::mutex> lock(gate_mutex_);
            ++entered;
            gate_cv_.wait(lock, [this]() { return permits_ > 0; });
            --permits_;
        }
        return FakeBackend::push_file(peer_id, path);
    }

    void release() {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        ++permits_;
        gate_cv_.notify_all();
    }

    std::atomic<int> entered{0};

private:
    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    int permits_ = 0;
};

} // namespace

TEST(BackendMonitorTest, RefreshesPeersAndSeedsInbox) {
    taildrive::testing::FakeBackend backend;
    backend.peers = {make_peer("self", true), make_peer("phone", false)};
    backend.inbox["early.txt"] = {'e'};
    ServerState state;

    BackendMonitor monitor(backend, state, 30s);
    monitor.run_once();

    EXPECT_EQ(state.peers.all().size(), 2u);
    EXPECT_EQ(state.peers.without_self().size(), 1u);
    ASSERT_TRUE(state.received.last_file().has_value());
    EXPECT_EQ(*state.received.last_file(), "early.txt");
}

TEST(BackendMonitorTest, InboxDoesNotOverrideEventBusFile) {
    taildrive::testing::FakeBackend backend;
    backend.inbox["older.txt"] = {'o'};
    ServerState state;
    state.received.record(model::InboundFile{"fresh.txt", std::nullopt, 1, "phone"});

    BackendMonitor monitor(backend, state, 30s);
    monitor.run_once();
    EXPECT_EQ(*state.received.last_file(), "fresh.txt");
}

TEST(BackendMonitorTest, FailureKeepsPreviousPeers) {
    taildrive::testing::FakeBackend backend;
    ServerState state;
    state.peers.replace({make_peer("phone", false)});
    backend.available = false;

    BackendMonitor monitor(backend, state, 30s);
    monitor.run_once();
    EXPECT_EQ(state.peers.all().size(), 1u);
}

TEST(BackendMonitorTest, StartRunsImmediatelyAndStops) {
    taildrive::testing::FakeBackend backend;
    backend.peers = {make_peer("phone", false)};
    ServerState state;

    BackendMonitor monitor(backend, state, 60s);
    monitor.start();
    EXPECT_TRUE(wait_until([&]() { return !state.peers.all().empty(); }));
    monitor.stop();
}

TEST(InboundWatcherTest, DeliversBusEvents) {
    taildrive::testing::FakeBackend backend;
    backend.bus_events = {model::InboundFile{"a.jpg", std::string("/tmp/a.jpg"), 1, "phone"}};
    ServerState state;

    InboundWatcher watcher(backend, [&state](const model::InboundFile& file) { state.received.record(file); },
                           1s);
    watcher.start();
    EXPECT_TRUE(watcher.is_running());
    EXPECT_TRUE(wait_until([&]() { return state.received.last_file().has_value(); }));
    watcher.stop();
    EXPECT_FALSE(watcher.is_running());

    EXPECT_EQ(*state.received.last_file(), "a.jpg");
    EXPECT_EQ(*state.received.path_for("a.jpg"), "/tmp/a.jpg");
}

TEST(InboundWatcherTest, RetriesAfterFailure) {
    taildrive::testing::FakeBackend backend;
    backend.available = false;

    InboundWatcher watcher(backend, [](const model::InboundFile&) {}, 0s);
    watcher.start();
    EXPECT_TRUE(wait_until([&]() { return backend.watch_calls.load() >= 3; }));
    watcher.stop();
}

TEST(FileSenderTest, RejectsMissingFile) {
    taildrive::testing::FakeBackend backend;
    SentInfoSlot slot;
    FileSender sender(backend, slot);

    auto result = sender.send("p1", fs::temp_directory_path() / "taildrive_no_such_file");
    EXPECT_TRUE(result.is_error());
    EXPECT_FALSE(slot.get().has_value());
}

TEST(FileSenderTest, SlotIsFinishedAfterSend) {
    const auto file = fs::temp_directory_path() / ("taildrive_sender_test_" + std::to_string(::getpid()) + ".txt");
    ASSERT_TRUE(write_file(file, std::string("12345678")).is_ok());

    taildrive::testing::FakeBackend backend;
    SentInfoSlot slot;
    FileSender sender(backend, slot);

    auto queued = sender.send("p1", file);
    ASSERT_TRUE(queued.is_ok());
    EXPECT_TRUE(queued.value().sending);
    EXPECT_EQ(queued.value().size, 8u);

    sender.wait_idle();
    auto finished = slot.get();
    ASSERT_TRUE(finished.has_value());
    EXPECT_FALSE(finished->sending);
    EXPECT_TRUE(finished->succeeded);
    EXPECT_EQ(finished->peer_id, "p1");

    fs::remove(file);
}

TEST(FileSenderTest, OlderSendDoesNotReplaceNewerSlot) {
    const auto dir = fs::temp_directory_path() / ("taildrive_sender_order_" + std::to_string(::getpid()));
    const auto first = dir / "a.txt";
    const auto second = dir / "b.txt";
    ASSERT_TRUE(write_file(first, std::string("a")).is_ok());
    ASSERT_TRUE(write_file(second, std::string("bb")).is_ok());

    GatedBackend backend;
    SentInfoSlot slot;
    {
        FileSender sender(backend, slot);
        ASSERT_TRUE(sender.send("p1", first).is_ok());
        ASSERT_TRUE(sender.send("p1", second).is_ok());

        // The second push only starts once the first has fully finished
        backend.release();
        ASSERT_TRUE(wait_until([&]() { return backend.entered.load() == 2; }));

        auto current = slot.get();
        ASSERT_TRUE(current.has_value());
        EXPECT_EQ(current->name, "b.txt");
        EXPECT_TRUE(current->sending);

        backend.release();
        sender.wait_idle();
    }

    auto finished = slot.get();
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->name, "b.txt");
    EXPECT_FALSE(finished->sending);
    EXPECT_TRUE(finished->succeeded);
    EXPECT_EQ(backend.recorded_pushes().size(), 2u);

    fs::remove_all(dir);
}
