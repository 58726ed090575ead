#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerConfig.h"
#include "session/RemoteSession.h"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace BjornManager {
namespace Events {
class EventSink;
}

namespace Session {

// Owns one RemoteSession per device identity. The map lock is held only for lookup, never
// across a remote operation, so devices never wait on each other.
class SessionManager {
public:
    SessionManager(
        SessionConfig config,
        std::shared_ptr<SshConnector> connector,
        std::shared_ptr<HostKeyVerifier> verifier,
        Events::EventSink& events,
        std::filesystem::path sshDir);
    ~SessionManager();

    // libssh2 transport, host-key policy from config, keys from ~/.ssh.
    static Outcome<std::unique_ptr<SessionManager>> create(
        const SessionConfig& config, Events::EventSink& events);

    // Creates the session on first use.
    std::shared_ptr<RemoteSession> session(const DeviceIdentity& identity);
    std::shared_ptr<RemoteSession> find(const DeviceIdentity& identity) const;

    VoidOutcome connect(
        const DeviceIdentity& identity, const std::string& address, const Credentials& credentials);
    void disconnect(const DeviceIdentity& identity);
    void disconnectAll();

    std::vector<DeviceIdentity> identities() const;

private:
    SessionConfig config_;
    std::shared_ptr<SshConnector> connector_;
    std::shared_ptr<HostKeyVerifier> verifier_;
    Events::EventSink& events_;
    std::filesystem::path sshDir_;

    mutable std::mutex mutex_;
    std::map<DeviceIdentity, std::shared_ptr<RemoteSession>> sessions_;
};

} // namespace Session
} // namespace BjornManager
