#pragma once

#include "core/ManagerConfig.h"
#include "core/ManagerError.h"
#include "core/Pimpl.h"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace BjornManager {
namespace Session {

struct HostKey {
    std::string type; // "ssh-ed25519", "ecdsa-sha2-nistp256", ...
    std::string blob; // Raw key bytes as sent by the server.
};

// Decides whether the key a server presents is acceptable for host:port.
class HostKeyVerifier {
public:
    virtual ~HostKeyVerifier() = default;

    virtual VoidOutcome verify(const std::string& host, int port, const HostKey& key) = 0;
};

// Trust on first use. The first key seen for host:port is remembered for the life of this
// object; a different key later is rejected.
class AcceptAnyHostKey : public HostKeyVerifier {
public:
    VoidOutcome verify(const std::string& host, int port, const HostKey& key) override;

private:
    std::mutex mutex_;
    std::map<std::string, HostKey> seen_;
};

// Accepts only keys listed in an OpenSSH known_hosts file. Matching, including hashed
// (|1|salt|hash) host names, is done by libssh2's known-host store.
class PinnedKnownHosts : public HostKeyVerifier {
public:
    PinnedKnownHosts();
    ~PinnedKnownHosts() override;

    PinnedKnownHosts(const PinnedKnownHosts&) = delete;
    PinnedKnownHosts& operator=(const PinnedKnownHosts&) = delete;

    static Outcome<std::shared_ptr<PinnedKnownHosts>> fromFile(const std::filesystem::path& path);

    // Same format as the file. Lines libssh2 cannot parse are skipped with a warning.
    static Outcome<std::shared_ptr<PinnedKnownHosts>> fromText(const std::string& text);

    size_t size() const;

    VoidOutcome verify(const std::string& host, int port, const HostKey& key) override;

private:
    struct Impl;
    Pimpl<Impl> pImpl_;
};

// Formats key as a known_hosts line for host:port.
std::string knownHostsLine(const std::string& host, int port, const HostKey& key);

// accept-any requires accept_unknown_hosts; anything else is a Config error.
Outcome<std::shared_ptr<HostKeyVerifier>> makeHostKeyVerifier(
    const SessionConfig& config, const std::filesystem::path& homeDir);

} // namespace Session
} // namespace BjornManager
