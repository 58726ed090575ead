#pragma once

#include "core/ManagerError.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Session {

class HostKeyVerifier;

enum class ReadStatus {
    Data,        // stdoutData and/or stderrData hold bytes.
    Timeout,     // Nothing arrived within the requested time.
    Eof,         // Remote side closed its output; close() then yields exitStatus().
    Interrupted, // interrupt() was called.
    Error,       // Transport failure; error holds the reason.
};

struct ChannelRead {
    ReadStatus status = ReadStatus::Timeout;
    std::string stdoutData;
    std::string stderrData;
    std::string error;
};

// One remote command. Not restartable; a new command needs a new channel.
// Everything except interrupt() must be called from one thread at a time.
class SshChannel {
public:
    virtual ~SshChannel() = default;

    virtual ChannelRead read(int timeoutMs) = 0;
    virtual VoidOutcome write(const std::string& data) = 0;
    virtual void sendEof() = 0;

    // Closes and frees the remote channel. Idempotent.
    virtual void close() = 0;

    // Set by close() after the command ran to completion.
    virtual std::optional<int> exitStatus() const = 0;

    // Thread-safe. A read in progress returns Interrupted within a short polling slice.
    virtual void interrupt() = 0;
};

struct AuthMethod {
    enum class Kind { PublicKey, Password };

    Kind kind = Kind::PublicKey;
    std::filesystem::path keyPath;
    // Password, or key passphrase for PublicKey.
    std::string secret;

    std::string describe() const;
};

struct ConnectRequest {
    std::string host;
    int port = 22;
    std::string user;
    // Tried in order on one transport until one is accepted.
    std::vector<AuthMethod> authMethods;
    int timeoutMs = 15000;
    int keepaliveSeconds = 30;
};

class SshConnection {
public:
    virtual ~SshConnection() = default;

    virtual Outcome<std::unique_ptr<SshChannel>> openExec(const std::string& command, bool pty) = 0;

    // Writes content to remotePath with the given permission bits. Partial transfers
    // are not resumed.
    virtual VoidOutcome sendFile(
        const std::string& content, const std::string& remotePath, int mode, int timeoutMs) = 0;

    // The auth method that was accepted.
    virtual const AuthMethod& authenticatedWith() const = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
};

class SshConnector {
public:
    virtual ~SshConnector() = default;

    // Connection error for unreachable hosts, rejected host keys, and exhausted auth.
    virtual Outcome<std::unique_ptr<SshConnection>> connect(
        const ConnectRequest& request, HostKeyVerifier& verifier) = 0;
};

} // namespace Session
} // namespace BjornManager
