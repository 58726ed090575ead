#include "session/RemoteSession.h"
#include "core/LoggingChannels.h"
#include "core/ShellQuote.h"
#include "events/EventSink.h"
#include "session/HostKeyVerifier.h"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <functional>
#include <sstream>

namespace BjornManager {
namespace Session {

namespace {

constexpr std::chrono::seconds kDisconnectGrace{ 5 };

int elapsedSince(std::chrono::steady_clock::time_point start)
{
    return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count());
}

class OperationGuard {
public:
    explicit OperationGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~OperationGuard() { release_(); }

    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;

private:
    std::function<void()> release_;
};

} // namespace

RemoteSession::RemoteSession(
    DeviceIdentity identity,
    SessionConfig config,
    std::shared_ptr<SshConnector> connector,
    std::shared_ptr<HostKeyVerifier> verifier,
    Events::EventSink& events,
    std::filesystem::path sshDir)
    : identity_(std::move(identity)),
      config_(std::move(config)),
      connector_(std::move(connector)),
      verifier_(std::move(verifier)),
      events_(events),
      sshDir_(std::move(sshDir))
{}

RemoteSession::~RemoteSession()
{
    disconnect();
}

VoidOutcome RemoteSession::connect(const std::string& address, const Credentials& credentials)
{
    {
        // Check and claim in one step; a concurrent caller sees Connecting.
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Connecting) {
            return failVoid(ErrorKind::Busy, "Already connecting to " + identity_);
        }
        if (state_ == SessionState::Connected) {
            LOG_DEBUG(Session, "'{}' already connected", identity_);
            return okayVoid();
        }
        address_ = address;
        state_ = SessionState::Connecting;
    }
    publishState(SessionState::Connecting, "Connecting to " + address);

    const auto keys = candidateKeyPaths(credentials.keyPath, sshDir_, config_.keyNames);
    ConnectRequest request;
    request.host = address;
    request.port = config_.port;
    request.user = credentials.user.empty() ? config_.defaultUser : credentials.user;
    request.authMethods = buildAuthMethods(credentials, keys);
    request.timeoutMs = config_.connectTimeoutSeconds * 1000;
    request.keepaliveSeconds = config_.keepaliveSeconds;

    if (request.authMethods.empty()) {
        const std::string message = "No usable key file or password";
        setState(SessionState::Failed, message);
        return failVoid(ErrorKind::Connection, message);
    }

    LOG_INFO(
        Session,
        "Connecting to {}@{}:{} ({} credential(s))",
        request.user,
        address,
        request.port,
        request.authMethods.size());
    auto connected = connector_->connect(request, *verifier_);
    if (connected.isError()) {
        LOG_WARN(Session, "Connect to '{}' failed: {}", identity_, connected.errorValue().message);
        setState(SessionState::Failed, connected.errorValue().message);
        return VoidOutcome::error(connected.errorValue());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = std::shared_ptr<SshConnection>(std::move(connected.value()));
        sudoPassword_ = credentials.effectiveSudoPassword();
    }
    setState(SessionState::Connected, "Connected to " + address);
    return okayVoid();
}

void RemoteSession::disconnect()
{
    std::shared_ptr<CommandStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connection_) {
            return;
        }
        stream = activeStream_.lock();
        if (activeChannel_) {
            activeChannel_->interrupt();
        }
    }
    if (stream) {
        stream->cancel();
    }

    std::shared_ptr<SshConnection> connection;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!idleCv_.wait_for(lock, kDisconnectGrace, [this] { return !busy_; })) {
            LOG_WARN(Session, "'{}' still busy, disconnecting anyway", identity_);
        }
        connection = std::move(connection_);
        connection_.reset();
        sudoPassword_.reset();
    }
    if (!connection) {
        return;
    }

    connection->disconnect();
    LOG_INFO(Session, "Disconnected from '{}'", identity_);
    setState(SessionState::Disconnected, "Disconnected");
}

SessionState RemoteSession::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string RemoteSession::address() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return address_;
}

std::optional<std::string> RemoteSession::sudoPassword() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sudoPassword_;
}

Outcome<CommandResult> RemoteSession::executeSimple(
    const std::string& command, const std::string& stdinData, std::chrono::milliseconds timeout)
{
    std::shared_ptr<SshConnection> connection;
    auto begun = beginOperation(connection);
    if (begun.isError()) {
        return Outcome<CommandResult>::error(begun.errorValue());
    }

    std::unique_ptr<SshChannel> channel;
    OperationGuard guard([this] { endOperation(); });

    const auto start = std::chrono::steady_clock::now();
    const auto effectiveTimeout = timeout.count() > 0
        ? timeout
        : std::chrono::milliseconds(config_.commandTimeoutSeconds * 1000);
    const auto deadline = start + effectiveTimeout;

    auto opened = connection->openExec(command, false);
    if (opened.isError()) {
        checkTransport();
        return Outcome<CommandResult>::error(opened.errorValue());
    }
    channel = std::move(opened.value());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeChannel_ = channel.get();
    }

    if (!stdinData.empty()) {
        auto written = channel->write(stdinData);
        if (written.isError()) {
            channel->close();
            return Outcome<CommandResult>::error(written.errorValue());
        }
    }
    channel->sendEof();

    CommandResult result;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const int remainingMs = static_cast<int>(std::max<int64_t>(remaining.count(), 0));
        const ChannelRead read = channel->read(remainingMs);
        if (read.status == ReadStatus::Data) {
            if (result.stdoutText.size() + read.stdoutData.size() > kMaxStdoutBytes
                || result.stderrText.size() + read.stderrData.size() > kMaxStderrBytes) {
                channel->close();
                return fail<CommandResult>(
                    ErrorKind::RemoteExecution,
                    "Remote output exceeded limit (stdout=" + std::to_string(kMaxStdoutBytes)
                        + " bytes, stderr=" + std::to_string(kMaxStderrBytes) + " bytes)");
            }
            result.stdoutText += read.stdoutData;
            result.stderrText += read.stderrData;
            continue;
        }
        if (read.status == ReadStatus::Eof) {
            break;
        }

        channel->close();
        switch (read.status) {
            case ReadStatus::Timeout:
                return fail<CommandResult>(
                    ErrorKind::Timeout,
                    "Remote command timed out after " + std::to_string(effectiveTimeout.count())
                        + "ms");
            case ReadStatus::Interrupted:
                return fail<CommandResult>(ErrorKind::Cancelled, "Remote command cancelled");
            default:
                checkTransport();
                return fail<CommandResult>(ErrorKind::RemoteExecution, read.error);
        }
    }

    channel->close();
    result.exitCode = channel->exitStatus().value_or(-1);
    result.elapsedMs = elapsedSince(start);
    LOG_DEBUG(
        Session,
        "'{}' exit {} after {} ms: {}",
        identity_,
        result.exitCode,
        result.elapsedMs,
        command);
    return Outcome<CommandResult>::okay(std::move(result));
}

Outcome<CommandResult> RemoteSession::executePrivileged(
    const std::string& command, std::chrono::milliseconds timeout)
{
    const auto password = sudoPassword();
    if (!password.has_value()) {
        return executeSimple(
            buildCommandString({ "sudo", "-n", "sh", "-c", command }), "", timeout);
    }
    return executeSimple(
        buildCommandString({ "sudo", "-S", "-p", "", "sh", "-c", command }),
        password.value() + "\n",
        timeout);
}

Outcome<std::shared_ptr<CommandStream>> RemoteSession::execute(
    const std::string& command, const StreamOptions& options)
{
    using StreamOutcome = Outcome<std::shared_ptr<CommandStream>>;

    std::shared_ptr<SshConnection> connection;
    auto begun = beginOperation(connection);
    if (begun.isError()) {
        return StreamOutcome::error(begun.errorValue());
    }

    auto opened = connection->openExec(command, options.pty);
    if (opened.isError()) {
        endOperation();
        checkTransport();
        return StreamOutcome::error(opened.errorValue());
    }

    const auto inactivity = options.inactivityTimeout.count() > 0
        ? options.inactivityTimeout
        : std::chrono::milliseconds(config_.commandTimeoutSeconds * 1000);
    auto stream = std::make_shared<CommandStream>(
        std::move(opened.value()), inactivity, [this] {
            endOperation();
            checkTransport();
        });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeStream_ = stream;
    }
    LOG_DEBUG(Session, "'{}' streaming: {}", identity_, command);
    return StreamOutcome::okay(stream);
}

Outcome<std::shared_ptr<CommandStream>> RemoteSession::tailLog(const std::string& unit)
{
    StreamOptions options;
    options.pty = true;
    options.inactivityTimeout = kTailInactivity;
    return execute("journalctl -fu " + shellEscapeArg(unit), options);
}

VoidOutcome RemoteSession::uploadFile(
    const std::filesystem::path& localPath, const std::string& remotePath, int mode)
{
    std::ifstream file(localPath, std::ios::binary);
    if (!file.is_open()) {
        return failVoid(ErrorKind::Transfer, "Cannot read " + localPath.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return failVoid(ErrorKind::Transfer, "Failed reading " + localPath.string());
    }
    return uploadText(buffer.str(), remotePath, mode);
}

VoidOutcome RemoteSession::uploadText(
    const std::string& content, const std::string& remotePath, int mode)
{
    std::shared_ptr<SshConnection> connection;
    auto begun = beginOperation(connection);
    if (begun.isError()) {
        return begun;
    }
    OperationGuard guard([this] { endOperation(); });

    const int timeoutMs = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(kUploadTimeout).count());
    auto sent = connection->sendFile(content, remotePath, mode, timeoutMs);
    if (sent.isError()) {
        LOG_ERROR(Session, "Upload to '{}' failed: {}", identity_, sent.errorValue().message);
        checkTransport();
        return sent;
    }
    LOG_INFO(Session, "Uploaded {} ({} bytes) to '{}'", remotePath, content.size(), identity_);
    return okayVoid();
}

VoidOutcome RemoteSession::beginOperation(std::shared_ptr<SshConnection>& connection)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Connected || !connection_) {
        return failVoid(ErrorKind::NotConnected, "'" + identity_ + "' is not connected");
    }
    if (busy_) {
        return failVoid(
            ErrorKind::Busy, "Another operation is already running on '" + identity_ + "'");
    }
    busy_ = true;
    connection = connection_;
    return okayVoid();
}

void RemoteSession::endOperation()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
        activeChannel_ = nullptr;
        activeStream_.reset();
    }
    idleCv_.notify_all();
}

void RemoteSession::setState(SessionState state, const std::string& message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state && state != SessionState::Failed) {
            return;
        }
        state_ = state;
    }
    publishState(state, message);
}

void RemoteSession::publishState(SessionState state, const std::string& message)
{
    LOG_DEBUG(Session, "'{}' -> {}: {}", identity_, toString(state), message);
    events_.publish(Events::SessionStateChanged{
        .identity = identity_,
        .state = state,
        .message = message,
    });
}

void RemoteSession::checkTransport()
{
    std::shared_ptr<SshConnection> lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connection_ || connection_->isConnected()) {
            return;
        }
        lost = std::move(connection_);
        connection_.reset();
    }
    LOG_WARN(Session, "Connection to '{}' lost", identity_);
    setState(SessionState::Disconnected, "Connection lost");
}

} // namespace Session
} // namespace BjornManager
