#pragma once

#include "core/ManagerConfig.h"
#include "core/ManagerError.h"
#include "session/RemoteSession.h"
#include <chrono>
#include <string>

namespace BjornManager {
namespace Installer {

// Day-two operations on an installed device. Each call blocks until the remote command
// has finished.
class RemoteAdministration {
public:
    static constexpr std::chrono::seconds kRestartTimeout{ 60 };
    static constexpr std::chrono::seconds kQuickTimeout{ 15 };

    RemoteAdministration(Session::RemoteSession& session, InstallConfig config);

    VoidOutcome restartService();

    // Rewrites the driver in shared.py, drops the cached config, then restarts.
    VoidOutcome changeDisplayDriver(const std::string& driver);

    // The connection usually drops before the command reports back; that counts as success.
    VoidOutcome reboot();

    std::string appDirectory() const;

private:
    Session::RemoteSession& session_;
    InstallConfig config_;
};

} // namespace Installer
} // namespace BjornManager
