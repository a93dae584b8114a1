#pragma once

#include "support/fake_backend.hpp"
#include "support/loopback_transport.hpp"
#include "support/temp_dir.hpp"
#include "taildrive/server/status_service.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace taildrive::testing {

/**
 * A complete desktop node in-process: fake daemon, real service and router,
 * and a loopback transport for the client side. Desktop files live under
 * root/desktop, mobile files under root/mobile.
 */
class DesktopHarness {
public:
    explicit DesktopHarness(const std::string& prefix)
        : root(create_temp_dir(prefix))
        , desktop_dir(root / "desktop")
        , mobile_dir(root / "mobile")
        , table(root / "sync_projects.json")
        , sender(backend, state.sent)
        , service(state, table, backend, sender,
                  server::StatusService::Options{root / "uploads", desktop_dir}) {
        std::filesystem::create_directories(desktop_dir);
        std::filesystem::create_directories(mobile_dir);
        service.register_routes(router);
        transport = std::make_shared<LoopbackTransport>(router);
    }

    ~DesktopHarness() {
        sender.wait_idle();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    DesktopHarness(const DesktopHarness&) = delete;
    DesktopHarness& operator=(const DesktopHarness&) = delete;

    std::filesystem::path root;
    std::filesystem::path desktop_dir;
    std::filesystem::path mobile_dir;

    FakeBackend backend;
    server::ServerState state;
    server::SyncProjectTable table;
    server::FileSender sender;
    server::StatusService service;
    network::HttpRouter router;
    std::shared_ptr<LoopbackTransport> transport;
};

} // namespace taildrive::testing
