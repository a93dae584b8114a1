#include "taildrive/client/reconciler.hpp"
#include "taildrive/client/notification_queue.hpp"
#include "taildrive/client/remote_api.hpp"
#include "taildrive/core/file_util.hpp"
#include "support/desktop_fixture.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace taildrive;
using namespace taildrive::client;

class ReconcilerTest : public ::testing::Test {
protected:
    ReconcilerTest()
        : desk_("taildrive_reconcile_test")
        , api_(desk_.transport)
        , reconciler_(api_, &notifications_) {}

    void SetUp() override {
        desk_file_ = desk_.desktop_dir / "notes.md";
        phone_file_ = desk_.mobile_dir / "notes.md";
        ASSERT_TRUE(write_file(desk_file_, std::string("desktop v1")).is_ok());
        ASSERT_TRUE(set_file_mtime(desk_file_, 1700000000).is_ok());

        auto created = desk_.table.create(desk_file_.string(), phone_file_.string());
        ASSERT_TRUE(created.is_ok());
        id_ = created.value().id;
    }

    ReconcileReport tick() {
        auto projects = api_.projects();
        auto changes = api_.check();
        EXPECT_TRUE(projects.is_ok());
        EXPECT_TRUE(changes.is_ok());
        return reconciler_.run(projects.value(), changes.value(),
                               [this](Event event) { events_.push_back(std::move(event)); });
    }

    std::string phone_contents() {
        auto bytes = read_file(phone_file_);
        return bytes.is_ok() ? std::string(bytes.value().begin(), bytes.value().end()) : "";
    }

    template<typename T>
    std::size_t count_events() const {
        std::size_t n = 0;
        for (const auto& event : events_) {
            n += std::holds_alternative<T>(event) ? 1 : 0;
        }
        return n;
    }

    taildrive::testing::DesktopHarness desk_;
    RemoteApi api_;
    NotificationQueue notifications_;
    Reconciler reconciler_;
    std::vector<Event> events_;

    fs::path desk_file_;
    fs::path phone_file_;
    std::string id_;
};

TEST_F(ReconcilerTest, PullsDesktopChangeAndAcknowledges) {
    auto report = tick();
    EXPECT_EQ(report.pulled, 1u);
    EXPECT_EQ(report.pushed, 0u);
    EXPECT_EQ(report.failed, 0u);

    EXPECT_EQ(phone_contents(), "desktop v1");
    EXPECT_EQ(file_mtime(phone_file_).value(), 1700000000u);
    EXPECT_EQ(desk_.table.list()[0].last_synced, 1700000000u);
    EXPECT_TRUE(desk_.table.check().empty());

    ASSERT_EQ(count_events<SyncPullCompletedEvent>(), 1u);
    const auto& pulled = std::get<SyncPullCompletedEvent>(events_[0]);
    EXPECT_EQ(pulled.project_id, id_);
    EXPECT_EQ(pulled.written_path, phone_file_.string());

    ASSERT_EQ(notifications_.front_title(), "Sync Complete");
    EXPECT_EQ(notifications_.consume_body(), "Pulled notes.md");
}

TEST_F(ReconcilerTest, SecondTickIsQuiet) {
    tick();
    events_.clear();
    auto report = tick();
    EXPECT_EQ(report.pulled, 0u);
    EXPECT_EQ(report.pushed, 0u);
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(desk_.transport->count("PUT /sync/upload"), 0u);
}

TEST_F(ReconcilerTest, PushesNewerMobileEdit) {
    tick();
    ASSERT_TRUE(write_file(phone_file_, std::string("phone edit")).is_ok());
    ASSERT_TRUE(set_file_mtime(phone_file_, 1700000500).is_ok());
    events_.clear();

    auto report = tick();
    EXPECT_EQ(report.pushed, 1u);

    auto desk_bytes = read_file(desk_file_);
    ASSERT_TRUE(desk_bytes.is_ok());
    EXPECT_EQ(std::string(desk_bytes.value().begin(), desk_bytes.value().end()), "phone edit");
    EXPECT_EQ(file_mtime(desk_file_).value(), 1700000500u);
    EXPECT_EQ(desk_.table.list()[0].last_synced, 1700000500u);

    // The desktop copy now carries the acknowledged mtime, so nothing bounces back
    EXPECT_TRUE(desk_.table.check().empty());

    ASSERT_EQ(count_events<UploadCompletedEvent>(), 1u);
    const auto& pushed = std::get<UploadCompletedEvent>(events_[0]);
    EXPECT_EQ(pushed.project_id, std::optional<std::string>(id_));
    EXPECT_EQ(pushed.local_path, phone_file_.string());
    EXPECT_EQ(pushed.remote_path, desk_file_.string());
}

TEST_F(ReconcilerTest, PausedProjectIsSkipped) {
    ASSERT_TRUE(desk_.table.set_paused(id_, true).is_ok());
    auto report = tick();
    EXPECT_EQ(report.pulled, 0u);
    EXPECT_FALSE(fs::exists(phone_file_));
    EXPECT_EQ(desk_.transport->count("GET /pull"), 0u);
}

TEST_F(ReconcilerTest, FailedPullBlocksPushAndReportsError) {
    ASSERT_TRUE(write_file(phone_file_, std::string("stale phone copy")).is_ok());
    ASSERT_TRUE(set_file_mtime(phone_file_, 1700000900).is_ok());

    // The desktop file vanishes between check and pull
    auto projects = api_.projects().value();
    auto changes = api_.check().value();
    fs::remove(desk_file_);

    auto report = reconciler_.run(projects, changes, [this](Event event) { events_.push_back(std::move(event)); });
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.pushed, 0u);
    EXPECT_EQ(count_events<ErrorEvent>(), 1u);
    EXPECT_EQ(desk_.transport->count("PUT /sync/upload"), 0u);
    EXPECT_EQ(desk_.table.list()[0].last_synced, 0u);
}

TEST_F(ReconcilerTest, OneFailingProjectDoesNotStopOthers) {
    const auto other_desk = desk_.desktop_dir / "todo.txt";
    const auto other_phone = desk_.mobile_dir / "todo.txt";
    ASSERT_TRUE(write_file(other_desk, std::string("todo")).is_ok());
    ASSERT_TRUE(set_file_mtime(other_desk, 1700000001).is_ok());
    ASSERT_TRUE(desk_.table.create(other_desk.string(), other_phone.string()).is_ok());

    // Mobile target for the first project cannot be created
    ASSERT_TRUE(write_file(desk_.mobile_dir / "blocker", std::string("file")).is_ok());
    ASSERT_TRUE(desk_.table.remove(id_).is_ok());
    ASSERT_TRUE(desk_.table.create(desk_file_.string(), (desk_.mobile_dir / "blocker" / "notes.md").string()).is_ok());

    auto report = tick();
    EXPECT_EQ(report.pulled, 1u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_TRUE(fs::exists(other_phone));
}
