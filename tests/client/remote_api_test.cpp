#include "taildrive/client/remote_api.hpp"
#include "taildrive/core/file_util.hpp"
#include "support/desktop_fixture.hpp"

#include <gtest/gtest.h>

using namespace taildrive;
using taildrive::client::RemoteApi;

class RemoteApiTest : public ::testing::Test {
protected:
    RemoteApiTest() : desk_("taildrive_api_test"), api_(desk_.transport) {}

    taildrive::testing::DesktopHarness desk_;
    RemoteApi api_;
};

TEST_F(RemoteApiTest, StatusDecodes) {
    desk_.state.received.record(model::InboundFile{"in.txt", std::nullopt, 2, "phone"});
    auto status = api_.status();
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().last_received_file, std::optional<std::string>("in.txt"));
    EXPECT_FALSE(status.value().last_sent.has_value());
    EXPECT_TRUE(status.value().server_cwd.has_value());
}

TEST_F(RemoteApiTest, TransportFailureIsError) {
    desk_.transport->reachable = false;
    auto status = api_.status();
    ASSERT_TRUE(status.is_error());
    EXPECT_NE(status.error().find("refused"), std::string::npos);
}

TEST_F(RemoteApiTest, HttpErrorCarriesServerMessage) {
    auto result = api_.download("missing.bin");
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("GET /download/missing.bin: HTTP 404"), std::string::npos);
    EXPECT_NE(result.error().find("not available"), std::string::npos);
}

TEST_F(RemoteApiTest, DownloadUsesContentDispositionName) {
    desk_.backend.inbox["photo one.jpg"] = {'j', 'p', 'g'};
    desk_.state.received.record(model::InboundFile{"photo one.jpg", std::nullopt, 3, "phone"});

    auto named = api_.download("photo one.jpg");
    ASSERT_TRUE(named.is_ok());
    EXPECT_EQ(named.value().filename, "photo one.jpg");
    EXPECT_EQ(named.value().data.size(), 3u);

    auto last = api_.download_last();
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value().filename, "photo one.jpg");
}

TEST_F(RemoteApiTest, FilesAndBrowse) {
    desk_.backend.inbox["a.txt"] = {'a'};
    auto files = api_.files();
    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].name, "a.txt");

    ASSERT_TRUE(write_file(desk_.desktop_dir / "doc.md", std::string("doc")).is_ok());
    auto home = api_.browse(std::nullopt);
    ASSERT_TRUE(home.is_ok());
    ASSERT_EQ(home.value().size(), 1u);
    EXPECT_EQ(home.value()[0].name, "doc.md");

    auto explicit_dir = api_.browse(desk_.desktop_dir.string());
    ASSERT_TRUE(explicit_dir.is_ok());
    EXPECT_EQ(explicit_dir.value().size(), 1u);
}

TEST_F(RemoteApiTest, PullAndUpload) {
    const auto desk_file = desk_.desktop_dir / "report.txt";
    ASSERT_TRUE(write_file(desk_file, std::string("quarterly")).is_ok());

    auto pulled = api_.pull(desk_file.string());
    ASSERT_TRUE(pulled.is_ok());
    EXPECT_EQ(pulled.value().filename, "report.txt");
    EXPECT_EQ(std::string(pulled.value().data.begin(), pulled.value().data.end()), "quarterly");

    const auto phone_file = desk_.mobile_dir / "pic.png";
    ASSERT_TRUE(write_file(phone_file, std::string("png")).is_ok());
    ASSERT_TRUE(api_.upload(phone_file, "/camera/pic 1.png").is_ok());
    EXPECT_TRUE(std::filesystem::exists(desk_.root / "uploads" / "camera" / "pic 1.png"));
    EXPECT_TRUE(api_.upload(phone_file, "/").is_error());
}

TEST_F(RemoteApiTest, ProjectsCheckAndAck) {
    const auto desk_file = desk_.desktop_dir / "notes.md";
    ASSERT_TRUE(write_file(desk_file, std::string("v1")).is_ok());
    ASSERT_TRUE(set_file_mtime(desk_file, 1700000000).is_ok());

    auto created = api_.create_project("/phone/notes.md", desk_file.string());
    ASSERT_TRUE(created.is_ok());
    EXPECT_EQ(created.value().local_path, desk_file.string());
    EXPECT_EQ(created.value().remote_path, "/phone/notes.md");

    auto changes = api_.check();
    ASSERT_TRUE(changes.is_ok());
    ASSERT_EQ(changes.value().size(), 1u);

    ASSERT_TRUE(api_.ack(created.value().id, 1700000000).is_ok());
    EXPECT_TRUE(api_.check().value().empty());

    ASSERT_TRUE(api_.delete_project(created.value().id).is_ok());
    EXPECT_TRUE(api_.projects().value().empty());
    EXPECT_TRUE(api_.delete_project(created.value().id).is_error());
}

TEST_F(RemoteApiTest, PeersExcludeSelf) {
    model::PeerInfo self;
    self.id = "self";
    self.is_self = true;
    model::PeerInfo phone;
    phone.id = "phone";
    phone.online = true;
    desk_.state.peers.replace({self, phone});

    auto peers = api_.peers();
    ASSERT_TRUE(peers.is_ok());
    ASSERT_EQ(peers.value().size(), 1u);
    EXPECT_EQ(peers.value()[0].id, "phone");
}
