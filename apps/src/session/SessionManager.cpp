#include "session/SessionManager.h"
#include "core/LoggingChannels.h"
#include "session/HostKeyVerifier.h"
#include "session/Libssh2Transport.h"

namespace BjornManager {
namespace Session {

SessionManager::SessionManager(
    SessionConfig config,
    std::shared_ptr<SshConnector> connector,
    std::shared_ptr<HostKeyVerifier> verifier,
    Events::EventSink& events,
    std::filesystem::path sshDir)
    : config_(std::move(config)),
      connector_(std::move(connector)),
      verifier_(std::move(verifier)),
      events_(events),
      sshDir_(std::move(sshDir))
{}

SessionManager::~SessionManager()
{
    disconnectAll();
}

Outcome<std::unique_ptr<SessionManager>> SessionManager::create(
    const SessionConfig& config, Events::EventSink& events)
{
    const auto home = homeDirectory();
    auto verifier = makeHostKeyVerifier(config, home);
    if (verifier.isError()) {
        return Outcome<std::unique_ptr<SessionManager>>::error(verifier.errorValue());
    }
    LOG_INFO(Session, "Host key policy: {}", toString(config.hostKeyPolicy));
    return Outcome<std::unique_ptr<SessionManager>>::okay(std::make_unique<SessionManager>(
        config,
        std::make_shared<Libssh2Connector>(),
        verifier.value(),
        events,
        home / ".ssh"));
}

std::shared_ptr<RemoteSession> SessionManager::session(const DeviceIdentity& identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(identity);
    if (it != sessions_.end()) {
        return it->second;
    }
    auto created =
        std::make_shared<RemoteSession>(identity, config_, connector_, verifier_, events_, sshDir_);
    sessions_.emplace(identity, created);
    return created;
}

std::shared_ptr<RemoteSession> SessionManager::find(const DeviceIdentity& identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(identity);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

VoidOutcome SessionManager::connect(
    const DeviceIdentity& identity, const std::string& address, const Credentials& credentials)
{
    return session(identity)->connect(address, credentials);
}

void SessionManager::disconnect(const DeviceIdentity& identity)
{
    if (auto existing = find(identity)) {
        existing->disconnect();
    }
}

void SessionManager::disconnectAll()
{
    std::vector<std::shared_ptr<RemoteSession>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [identity, session] : sessions_) {
            all.push_back(session);
        }
    }
    for (auto& session : all) {
        session->disconnect();
    }
}

std::vector<DeviceIdentity> SessionManager::identities() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceIdentity> result;
    for (const auto& [identity, session] : sessions_) {
        result.push_back(identity);
    }
    return result;
}

} // namespace Session
} // namespace BjornManager
