#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerConfig.h"
#include "core/ManagerError.h"
#include "installer/InstallJob.h"
#include "installer/InstallOptions.h"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace BjornManager {
namespace Events {
class EventSink;
}
namespace Session {
class CommandStream;
class RemoteSession;
} // namespace Session

namespace Installer {

class ScriptValidator;

/**
 * @brief Runs the remote install protocol as one job per device.
 *
 * runInstall() blocks the calling thread for the whole job: asset upload, then the remote
 * entry point on a pty, parsing its output into installProgress and installLog events.
 * Exactly one installFinished is published per job. Jobs on different devices are
 * independent; a second job for a device that already has one is refused with Busy.
 */
class InstallOrchestrator {
public:
    static constexpr std::chrono::seconds kDeployTimeout{ 120 };

    InstallOrchestrator(
        InstallConfig config,
        Events::EventSink& events,
        std::shared_ptr<ScriptValidator> validator);

    // Returns the terminal job. Busy when this device already has a running job.
    Outcome<InstallJobSnapshot> runInstall(
        Session::RemoteSession& session, const InstallOptions& options);

    // Thread-safe. Kills the remote script; the job ends Aborted. False when no job runs.
    bool cancel(const DeviceIdentity& identity);

    std::optional<InstallJobSnapshot> activeJob(const DeviceIdentity& identity) const;

    const InstallConfig& config() const { return config_; }

private:
    struct ActiveJob {
        std::shared_ptr<InstallJob> job;
        std::shared_ptr<Session::CommandStream> stream;
        bool cancelRequested = false;
    };

    // Uploads what the mode needs and returns the remote script to run.
    Outcome<std::string> uploadAssets(
        Session::RemoteSession& session, const InstallOptions& options);
    Outcome<std::string> uploadCustomScript(
        Session::RemoteSession& session, const std::string& localPath);
    Outcome<std::string> uploadStockScripts(Session::RemoteSession& session);
    VoidOutcome deployDebugBundle(
        Session::RemoteSession& session, const std::filesystem::path& bundle);

    void streamInstall(
        Session::RemoteSession& session,
        const InstallOptions& options,
        InstallJob& job,
        const std::string& remoteScript);

    bool cancelRequested(const DeviceIdentity& identity) const;
    InstallJobSnapshot finish(
        Session::RemoteSession& session, const InstallOptions& options, InstallJob& job);

    InstallConfig config_;
    Events::EventSink& events_;
    std::shared_ptr<ScriptValidator> validator_;

    mutable std::mutex mutex_;
    std::map<DeviceIdentity, ActiveJob> active_;
};

} // namespace Installer
} // namespace BjornManager
