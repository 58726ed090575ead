#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerConfig.h"
#include "core/ManagerError.h"
#include "session/CommandStream.h"
#include "session/Credentials.h"
#include "session/SshTransport.h"
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace BjornManager {
namespace Events {
class EventSink;
}

namespace Session {

class HostKeyVerifier;

struct CommandResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    int elapsedMs = 0;
};

struct StreamOptions {
    bool pty = false;
    // Zero means the session's command timeout.
    std::chrono::milliseconds inactivityTimeout{ 0 };
};

/**
 * @brief One authenticated connection to one device.
 *
 * Disconnected -> Connecting -> Connected | Failed; Failed may connect again; Connected
 * returns to Disconnected on disconnect() or when the transport drops. Each transition is
 * published as sessionStateChanged.
 *
 * Only one remote operation runs at a time: a second call while a command, upload or
 * stream is active fails with Busy. Sessions for different devices share nothing.
 */
class RemoteSession {
public:
    static constexpr size_t kMaxStdoutBytes = 2 * 1024 * 1024;
    static constexpr size_t kMaxStderrBytes = 2 * 1024 * 1024;
    static constexpr std::chrono::minutes kUploadTimeout{ 10 };
    static constexpr std::chrono::hours kTailInactivity{ 24 };

    RemoteSession(
        DeviceIdentity identity,
        SessionConfig config,
        std::shared_ptr<SshConnector> connector,
        std::shared_ptr<HostKeyVerifier> verifier,
        Events::EventSink& events,
        std::filesystem::path sshDir);
    ~RemoteSession();

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    VoidOutcome connect(const std::string& address, const Credentials& credentials);

    // Cancels any active stream, then closes the transport. Idempotent.
    void disconnect();

    SessionState state() const;
    const DeviceIdentity& identity() const { return identity_; }
    std::string address() const;
    std::optional<std::string> sudoPassword() const;
    const SessionConfig& config() const { return config_; }

    // Runs to completion. A non-zero exit status is a value, not an error.
    Outcome<CommandResult> executeSimple(
        const std::string& command,
        const std::string& stdinData = "",
        std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // sudo -S with the sudo password on stdin; sudo -n when there is no password.
    Outcome<CommandResult> executePrivileged(
        const std::string& command,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    Outcome<std::shared_ptr<CommandStream>> execute(
        const std::string& command, const StreamOptions& options = StreamOptions{});

    // journalctl follow on a pty, so closing the channel ends the remote process.
    Outcome<std::shared_ptr<CommandStream>> tailLog(const std::string& unit);

    VoidOutcome uploadFile(
        const std::filesystem::path& localPath, const std::string& remotePath, int mode = 0644);
    VoidOutcome uploadText(const std::string& content, const std::string& remotePath, int mode);

private:
    VoidOutcome beginOperation(std::shared_ptr<SshConnection>& connection);
    void endOperation();
    void setState(SessionState state, const std::string& message);
    void publishState(SessionState state, const std::string& message);
    void checkTransport();

    DeviceIdentity identity_;
    SessionConfig config_;
    std::shared_ptr<SshConnector> connector_;
    std::shared_ptr<HostKeyVerifier> verifier_;
    Events::EventSink& events_;
    std::filesystem::path sshDir_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    SessionState state_ = SessionState::Disconnected;
    std::string address_;
    std::optional<std::string> sudoPassword_;
    std::shared_ptr<SshConnection> connection_;
    bool busy_ = false;
    SshChannel* activeChannel_ = nullptr;
    std::weak_ptr<CommandStream> activeStream_;
};

} // namespace Session
} // namespace BjornManager
