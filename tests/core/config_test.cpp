#include "taildrive/core/config.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using taildrive::testing::create_temp_dir;
using json = nlohmann::json;
using namespace taildrive;

TEST(ServerConfig, DefaultsFollowHome) {
    const ServerConfig config = default_server_config();
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.local_api_socket, "/var/run/tailscale/tailscaled.sock");
    EXPECT_EQ(config.upload_root, home_directory() / "Taildrive");
    EXPECT_EQ(config.config_dir, home_directory() / ".config" / "taildrive");
}

TEST(ServerConfig, JsonOverridesOnlyPresentKeys) {
    const json doc = {{"port", 9090}, {"upload_root", "/srv/drop"}, {"log_level", "debug"}};
    auto config = server_config_from_json(doc, default_server_config());
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().port, 9090);
    EXPECT_EQ(config.value().upload_root, fs::path("/srv/drop"));
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_EQ(config.value().bind_address, "0.0.0.0");
    EXPECT_EQ(config.value().monitor_interval_seconds, 5);
}

TEST(ServerConfig, WrongTypeIsAnError) {
    const json doc = {{"port", "eighty"}};
    EXPECT_TRUE(server_config_from_json(doc, default_server_config()).is_error());
}

TEST(ServerConfig, ZeroWorkersRejected) {
    const json doc = {{"worker_threads", 0}};
    EXPECT_TRUE(server_config_from_json(doc, default_server_config()).is_error());
}

TEST(ServerConfig, FlagsOverrideConfigFile) {
    const auto dir = create_temp_dir("taildrive_config_test");
    const auto file = dir / "desktop.json";
    {
        std::ofstream out(file);
        out << R"({"port": 9000, "local_api_socket": "/tmp/ts.sock", "worker_threads": 2})";
    }

    const std::string file_arg = file.string();
    const char* argv[] = {"taildrive-desktop", "--config", file_arg.c_str(), "-p", "9100", "-v"};
    auto config = parse_server_args(6, argv);
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().port, 9100);
    EXPECT_EQ(config.value().local_api_socket, "/tmp/ts.sock");
    EXPECT_EQ(config.value().worker_threads, 2u);
    EXPECT_EQ(config.value().log_level, "debug");

    fs::remove_all(dir);
}

TEST(ServerConfig, UnknownFlagRejected) {
    const char* argv[] = {"taildrive-desktop", "--frobnicate"};
    EXPECT_TRUE(parse_server_args(2, argv).is_error());
}

TEST(ServerConfig, BadPortRejected) {
    const char* argv[] = {"taildrive-desktop", "--port", "70000"};
    EXPECT_TRUE(parse_server_args(3, argv).is_error());

    const char* argv2[] = {"taildrive-desktop", "--port", "80x"};
    EXPECT_TRUE(parse_server_args(3, argv2).is_error());
}

TEST(ServerConfig, MissingConfigFileRejected) {
    const char* argv[] = {"taildrive-desktop", "--config", "/nonexistent/taildrive.json"};
    EXPECT_TRUE(parse_server_args(3, argv).is_error());
}

TEST(ClientConfig, FlagsAndDefaults) {
    const char* argv[] = {"taildrive-mobile", "--server", "http://desktop:8080", "-d", "/tmp/saves"};
    auto config = parse_client_args(5, argv);
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().server_url, "http://desktop:8080");
    EXPECT_EQ(config.value().save_directory, fs::path("/tmp/saves"));
    EXPECT_EQ(config.value().poll_interval_ms, 3000);
    EXPECT_EQ(config.value().tick_ms, 100);
    EXPECT_EQ(config.value().http_timeout_ms, 8000);
}

TEST(ClientConfig, NonPositiveIntervalRejected) {
    const json doc = {{"poll_interval_ms", 0}};
    EXPECT_TRUE(client_config_from_json(doc, default_client_config()).is_error());
}
