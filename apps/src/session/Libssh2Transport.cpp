#include "session/Libssh2Transport.h"
#include "core/LoggingChannels.h"
#include "session/HostKeyVerifier.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <libssh2.h>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace BjornManager {
namespace Session {

namespace {

using Deadline = std::chrono::steady_clock::time_point;

constexpr int kPollSliceMs = 100;
constexpr int kChannelSetupTimeoutMs = 15000;
constexpr int kWriteTimeoutMs = 10000;
constexpr size_t kReadChunkLimit = 64 * 1024;
// Returned by retry() when the deadline passes; libssh2 itself never uses it.
constexpr int kRetryTimedOut = -1000;

struct Libssh2Library {
    bool ready = false;

    Libssh2Library() { ready = (libssh2_init(0) == 0); }
    ~Libssh2Library()
    {
        if (ready) {
            libssh2_exit();
        }
    }
};

bool libssh2Ready()
{
    static Libssh2Library library;
    return library.ready;
}

struct SocketCloser {
    int fd = -1;

    ~SocketCloser()
    {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

Deadline deadlineIn(int ms)
{
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}

int remainingMs(const Deadline& deadline)
{
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return 0;
    }
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

bool waitSocket(int socketFd, int directions, int timeoutMs)
{
    if (timeoutMs <= 0) {
        return false;
    }

    pollfd pfd;
    pfd.fd = socketFd;
    pfd.events = 0;
    pfd.revents = 0;

    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) {
        pfd.events |= POLLIN;
    }
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
        pfd.events |= POLLOUT;
    }
    if (pfd.events == 0) {
        pfd.events = POLLIN;
    }

    const int rc = poll(&pfd, 1, timeoutMs);
    return rc > 0;
}

std::string getLibssh2Error(LIBSSH2_SESSION* session, int rc)
{
    if (rc == kRetryTimedOut) {
        return "timed out";
    }
    if (!session) {
        return "libssh2 error: " + std::to_string(rc);
    }
    char* message = nullptr;
    int length = 0;
    libssh2_session_last_error(session, &message, &length, 0);
    if (message && length > 0) {
        return std::string(message, static_cast<size_t>(length));
    }
    return "libssh2 error: " + std::to_string(rc);
}

using AddressList = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

// One non-blocking connect attempt. The error says whether the deadline or the peer ended it.
Outcome<int> connectAddress(const addrinfo& address, const Deadline& deadline)
{
    SocketCloser socket;
    socket.fd = ::socket(
        address.ai_family, address.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, address.ai_protocol);
    if (socket.fd < 0) {
        return fail<int>(ErrorKind::Connection, std::strerror(errno));
    }

    if (::connect(socket.fd, address.ai_addr, address.ai_addrlen) != 0) {
        if (errno != EINPROGRESS) {
            return fail<int>(ErrorKind::Connection, std::strerror(errno));
        }
        if (!waitSocket(socket.fd, LIBSSH2_SESSION_BLOCK_OUTBOUND, remainingMs(deadline))) {
            return fail<int>(ErrorKind::Timeout, "timed out");
        }
        int socketError = 0;
        socklen_t length = sizeof(socketError);
        if (getsockopt(socket.fd, SOL_SOCKET, SO_ERROR, &socketError, &length) != 0) {
            return fail<int>(ErrorKind::Connection, std::strerror(errno));
        }
        if (socketError != 0) {
            return fail<int>(ErrorKind::Connection, std::strerror(socketError));
        }
    }

    const int fd = socket.fd;
    socket.fd = -1;
    return Outcome<int>::okay(fd);
}

// Tries each resolved address until one connects or the deadline passes.
Outcome<int> connectSocket(const std::string& host, int port, const Deadline& deadline)
{
    const std::string target = host + ":" + std::to_string(port);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    const int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &resolved);
    if (rc != 0) {
        return fail<int>(
            ErrorKind::Connection, "Cannot resolve " + host + ": " + gai_strerror(rc));
    }
    const AddressList addresses(resolved, &freeaddrinfo);

    ManagerError lastError{ ErrorKind::Timeout, "timed out" };
    for (const addrinfo* address = addresses.get(); address; address = address->ai_next) {
        if (remainingMs(deadline) <= 0) {
            lastError = ManagerError{ ErrorKind::Timeout, "timed out" };
            break;
        }
        auto connected = connectAddress(*address, deadline);
        if (connected.isValue()) {
            LOG_DEBUG(Session, "TCP connected to {}", target);
            return connected;
        }
        lastError = connected.errorValue();
        LOG_DEBUG(Session, "TCP connect to {} failed: {}", target, lastError.message);
    }

    return fail<int>(lastError.kind, "Failed to connect to " + target + ": " + lastError.message);
}

const char* hostKeyTypeName(int type)
{
    switch (type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return "ssh-rsa";
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return "ssh-dss";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return "ecdsa-sha2-nistp256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return "ecdsa-sha2-nistp384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return "ecdsa-sha2-nistp521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return "ssh-ed25519";
    }
    return "unknown";
}

// Owns the socket and the libssh2 session. Channels keep it alive until they are freed.
struct SessionHandle {
    LIBSSH2_SESSION* session = nullptr;
    int fd = -1;
    std::mutex mutex;
    std::atomic<bool> alive{ true };

    ~SessionHandle()
    {
        if (session) {
            libssh2_session_disconnect(session, "Normal Shutdown");
            libssh2_session_free(session);
        }
        if (fd >= 0) {
            ::close(fd);
        }
    }

    // Calls op under the session lock until it stops returning EAGAIN.
    template <typename Op>
    int retry(const Deadline& deadline, Op op)
    {
        while (true) {
            int rc = 0;
            int directions = 0;
            {
                std::lock_guard<std::mutex> lock(mutex);
                rc = op();
                directions = libssh2_session_block_directions(session);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) {
                return rc;
            }
            if (!waitSocket(fd, directions, remainingMs(deadline))) {
                return kRetryTimedOut;
            }
        }
    }

    std::string lastError(int rc)
    {
        std::lock_guard<std::mutex> lock(mutex);
        return getLibssh2Error(session, rc);
    }
};

// Returns the exit status reported by the remote side, or -1.
int closeChannel(SessionHandle& handle, LIBSSH2_CHANNEL* channel)
{
    if (!channel) {
        return -1;
    }

    for (int i = 0; i < 5; ++i) {
        int rc = 0;
        {
            std::lock_guard<std::mutex> lock(handle.mutex);
            rc = libssh2_channel_close(channel);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        waitSocket(handle.fd, LIBSSH2_SESSION_BLOCK_INBOUND, 100);
    }

    for (int i = 0; i < 5; ++i) {
        int rc = 0;
        {
            std::lock_guard<std::mutex> lock(handle.mutex);
            rc = libssh2_channel_wait_closed(channel);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        waitSocket(handle.fd, LIBSSH2_SESSION_BLOCK_INBOUND, 100);
    }

    std::lock_guard<std::mutex> lock(handle.mutex);
    const int exitStatus = libssh2_channel_get_exit_status(channel);
    libssh2_channel_free(channel);
    return exitStatus;
}

class Libssh2Channel : public SshChannel {
public:
    Libssh2Channel(std::shared_ptr<SessionHandle> handle, LIBSSH2_CHANNEL* channel)
        : handle_(std::move(handle)), channel_(channel)
    {}

    ~Libssh2Channel() override { close(); }

    ChannelRead read(int timeoutMs) override
    {
        ChannelRead result;
        if (!channel_) {
            result.status = ReadStatus::Error;
            result.error = "Channel is closed";
            return result;
        }

        const Deadline deadline = deadlineIn(timeoutMs);
        char buffer[4096];
        while (true) {
            if (interrupted_) {
                result.status = ReadStatus::Interrupted;
                return result;
            }

            bool eof = false;
            int directions = 0;
            ssize_t failure = 0;
            {
                std::lock_guard<std::mutex> lock(handle_->mutex);
                while (result.stdoutData.size() < kReadChunkLimit) {
                    const ssize_t rc = libssh2_channel_read(channel_, buffer, sizeof(buffer));
                    if (rc > 0) {
                        result.stdoutData.append(buffer, static_cast<size_t>(rc));
                        continue;
                    }
                    if (rc < 0 && rc != LIBSSH2_ERROR_EAGAIN) {
                        failure = rc;
                    }
                    break;
                }
                while (failure == 0 && result.stderrData.size() < kReadChunkLimit) {
                    const ssize_t rc =
                        libssh2_channel_read_stderr(channel_, buffer, sizeof(buffer));
                    if (rc > 0) {
                        result.stderrData.append(buffer, static_cast<size_t>(rc));
                        continue;
                    }
                    if (rc < 0 && rc != LIBSSH2_ERROR_EAGAIN) {
                        failure = rc;
                    }
                    break;
                }
                eof = libssh2_channel_eof(channel_) != 0;
                directions = libssh2_session_block_directions(handle_->session);
            }

            if (failure != 0) {
                handle_->alive = false;
                result.status = ReadStatus::Error;
                result.error = "SSH read failed: " + handle_->lastError(static_cast<int>(failure));
                return result;
            }
            if (!result.stdoutData.empty() || !result.stderrData.empty()) {
                result.status = ReadStatus::Data;
                return result;
            }
            if (eof) {
                result.status = ReadStatus::Eof;
                return result;
            }

            const int remaining = remainingMs(deadline);
            if (remaining <= 0) {
                result.status = ReadStatus::Timeout;
                return result;
            }
            waitSocket(handle_->fd, directions, std::min(remaining, kPollSliceMs));
        }
    }

    VoidOutcome write(const std::string& data) override
    {
        if (!channel_) {
            return failVoid(ErrorKind::RemoteExecution, "Channel is closed");
        }
        const Deadline deadline = deadlineIn(kWriteTimeoutMs);
        size_t offset = 0;
        while (offset < data.size()) {
            const int rc = handle_->retry(deadline, [&] {
                return static_cast<int>(
                    libssh2_channel_write(channel_, data.data() + offset, data.size() - offset));
            });
            if (rc < 0) {
                return failVoid(
                    rc == kRetryTimedOut ? ErrorKind::Timeout : ErrorKind::RemoteExecution,
                    "SSH write failed: " + handle_->lastError(rc));
            }
            offset += static_cast<size_t>(rc);
        }
        return okayVoid();
    }

    void sendEof() override
    {
        if (!channel_) {
            return;
        }
        const int rc = handle_->retry(deadlineIn(kWriteTimeoutMs), [&] {
            return libssh2_channel_send_eof(channel_);
        });
        if (rc != 0) {
            LOG_DEBUG(Session, "SSH send EOF failed: {}", handle_->lastError(rc));
        }
    }

    void close() override
    {
        if (!channel_) {
            return;
        }
        const int status = closeChannel(*handle_, channel_);
        channel_ = nullptr;
        if (!interrupted_) {
            exitStatus_ = status;
        }
    }

    std::optional<int> exitStatus() const override { return exitStatus_; }

    void interrupt() override { interrupted_ = true; }

private:
    std::shared_ptr<SessionHandle> handle_;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    std::atomic<bool> interrupted_{ false };
    std::optional<int> exitStatus_;
};

class Libssh2Connection : public SshConnection {
public:
    Libssh2Connection(std::shared_ptr<SessionHandle> handle, AuthMethod auth, int keepaliveSeconds)
        : handle_(std::move(handle)), auth_(std::move(auth))
    {
        if (keepaliveSeconds > 0) {
            keepaliveThread_ = std::thread([this, keepaliveSeconds] {
                keepaliveLoop(std::chrono::seconds(keepaliveSeconds));
            });
        }
    }

    ~Libssh2Connection() override { disconnect(); }

    Outcome<std::unique_ptr<SshChannel>> openExec(const std::string& command, bool pty) override
    {
        using ChannelOutcome = Outcome<std::unique_ptr<SshChannel>>;
        if (!isConnected()) {
            return fail<std::unique_ptr<SshChannel>>(ErrorKind::NotConnected, "Not connected");
        }

        const Deadline deadline = deadlineIn(kChannelSetupTimeoutMs);
        LIBSSH2_CHANNEL* channel = nullptr;
        const int openRc = handle_->retry(deadline, [&] {
            channel = libssh2_channel_open_session(handle_->session);
            return channel ? 0 : libssh2_session_last_errno(handle_->session);
        });
        if (openRc != 0) {
            return fail<std::unique_ptr<SshChannel>>(
                openRc == kRetryTimedOut ? ErrorKind::Timeout : ErrorKind::RemoteExecution,
                "SSH channel open failed: " + handle_->lastError(openRc));
        }
        auto wrapped = std::make_unique<Libssh2Channel>(handle_, channel);

        if (pty) {
            const int ptyRc = handle_->retry(deadline, [&] {
                return libssh2_channel_request_pty(channel, "xterm");
            });
            if (ptyRc != 0) {
                return fail<std::unique_ptr<SshChannel>>(
                    ErrorKind::RemoteExecution,
                    "SSH pty request failed: " + handle_->lastError(ptyRc));
            }
        }

        const int execRc = handle_->retry(deadline, [&] {
            return libssh2_channel_exec(channel, command.c_str());
        });
        if (execRc != 0) {
            return fail<std::unique_ptr<SshChannel>>(
                execRc == kRetryTimedOut ? ErrorKind::Timeout : ErrorKind::RemoteExecution,
                "SSH exec failed: " + handle_->lastError(execRc));
        }
        return ChannelOutcome::okay(std::move(wrapped));
    }

    VoidOutcome sendFile(
        const std::string& content,
        const std::string& remotePath,
        int mode,
        int timeoutMs) override
    {
        if (!isConnected()) {
            return failVoid(ErrorKind::NotConnected, "Not connected");
        }

        const Deadline deadline = deadlineIn(timeoutMs);
        LIBSSH2_CHANNEL* channel = nullptr;
        const int openRc = handle_->retry(deadline, [&] {
            channel = libssh2_scp_send64(
                handle_->session,
                remotePath.c_str(),
                mode & 0777,
                static_cast<libssh2_int64_t>(content.size()),
                0,
                0);
            return channel ? 0 : libssh2_session_last_errno(handle_->session);
        });
        if (openRc != 0) {
            return failVoid(
                ErrorKind::Transfer,
                "Cannot open " + remotePath + " for upload: " + handle_->lastError(openRc));
        }

        size_t offset = 0;
        while (offset < content.size()) {
            const int rc = handle_->retry(deadline, [&] {
                return static_cast<int>(libssh2_channel_write(
                    channel, content.data() + offset, content.size() - offset));
            });
            if (rc < 0) {
                const std::string error = handle_->lastError(rc);
                closeChannel(*handle_, channel);
                return failVoid(
                    ErrorKind::Transfer,
                    "Upload of " + remotePath + " failed after " + std::to_string(offset)
                        + " bytes: " + error);
            }
            offset += static_cast<size_t>(rc);
        }

        handle_->retry(deadline, [&] { return libssh2_channel_send_eof(channel); });
        handle_->retry(deadline, [&] { return libssh2_channel_wait_eof(channel); });
        closeChannel(*handle_, channel);
        LOG_DEBUG(Session, "Uploaded {} bytes to {}", content.size(), remotePath);
        return okayVoid();
    }

    const AuthMethod& authenticatedWith() const override { return auth_; }

    void disconnect() override
    {
        {
            std::lock_guard<std::mutex> lock(keepaliveMutex_);
            stopKeepalive_ = true;
        }
        keepaliveCv_.notify_all();
        if (keepaliveThread_.joinable()) {
            keepaliveThread_.join();
        }
        handle_->alive = false;
    }

    bool isConnected() const override { return handle_->alive; }

private:
    void keepaliveLoop(std::chrono::seconds interval)
    {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(keepaliveMutex_);
                if (keepaliveCv_.wait_for(lock, interval, [this] { return stopKeepalive_; })) {
                    return;
                }
            }
            if (!handle_->alive) {
                return;
            }

            int nextSeconds = 0;
            int rc = 0;
            {
                std::lock_guard<std::mutex> lock(handle_->mutex);
                rc = libssh2_keepalive_send(handle_->session, &nextSeconds);
            }
            if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
                LOG_WARN(Session, "Keep-alive failed: {}", handle_->lastError(rc));
                handle_->alive = false;
                return;
            }
        }
    }

    std::shared_ptr<SessionHandle> handle_;
    AuthMethod auth_;

    std::thread keepaliveThread_;
    std::mutex keepaliveMutex_;
    std::condition_variable keepaliveCv_;
    bool stopKeepalive_ = false;
};

int authenticate(
    SessionHandle& handle,
    const std::string& user,
    const AuthMethod& method,
    const Deadline& deadline)
{
    if (method.kind == AuthMethod::Kind::Password) {
        return handle.retry(deadline, [&] {
            return libssh2_userauth_password(handle.session, user.c_str(), method.secret.c_str());
        });
    }

    std::filesystem::path publicKey = method.keyPath;
    publicKey += ".pub";
    std::error_code error;
    const bool havePublic = std::filesystem::exists(publicKey, error);
    const std::string publicKeyText = publicKey.string();
    const std::string privateKeyText = method.keyPath.string();

    return handle.retry(deadline, [&] {
        return libssh2_userauth_publickey_fromfile(
            handle.session,
            user.c_str(),
            havePublic ? publicKeyText.c_str() : nullptr,
            privateKeyText.c_str(),
            method.secret.empty() ? nullptr : method.secret.c_str());
    });
}

} // namespace

Outcome<std::unique_ptr<SshConnection>> Libssh2Connector::connect(
    const ConnectRequest& request, HostKeyVerifier& verifier)
{
    using ConnectionOutcome = Outcome<std::unique_ptr<SshConnection>>;
    auto failConnect = [](ErrorKind kind, std::string message) {
        return fail<std::unique_ptr<SshConnection>>(kind, std::move(message));
    };

    if (!libssh2Ready()) {
        return failConnect(ErrorKind::Connection, "libssh2 initialization failed");
    }
    if (request.authMethods.empty()) {
        return failConnect(ErrorKind::Connection, "No credentials to try");
    }

    const Deadline deadline = deadlineIn(request.timeoutMs);
    auto socketResult = connectSocket(request.host, request.port, deadline);
    if (socketResult.isError()) {
        return ConnectionOutcome::error(socketResult.errorValue());
    }

    auto handle = std::make_shared<SessionHandle>();
    handle->fd = socketResult.value();
    handle->session = libssh2_session_init();
    if (!handle->session) {
        return failConnect(ErrorKind::Connection, "Failed to initialize SSH session");
    }
    libssh2_session_set_blocking(handle->session, 0);

    const int handshakeRc = handle->retry(deadline, [&] {
        return libssh2_session_handshake(handle->session, handle->fd);
    });
    if (handshakeRc != 0) {
        return failConnect(
            handshakeRc == kRetryTimedOut ? ErrorKind::Timeout : ErrorKind::Connection,
            "SSH handshake with " + request.host + " failed: " + handle->lastError(handshakeRc));
    }

    size_t keyLength = 0;
    int keyType = 0;
    const char* rawKey = libssh2_session_hostkey(handle->session, &keyLength, &keyType);
    if (!rawKey) {
        return failConnect(ErrorKind::Connection, "Failed to read host key");
    }
    const HostKey hostKey{ hostKeyTypeName(keyType), std::string(rawKey, keyLength) };
    auto verified = verifier.verify(request.host, request.port, hostKey);
    if (verified.isError()) {
        return ConnectionOutcome::error(verified.errorValue());
    }

    for (const auto& method : request.authMethods) {
        const int rc = authenticate(*handle, request.user, method, deadline);
        if (rc == 0) {
            LOG_INFO(
                Session,
                "Authenticated to {}@{} with {}",
                request.user,
                request.host,
                method.describe());
            {
                std::lock_guard<std::mutex> lock(handle->mutex);
                const int interval = std::max(request.keepaliveSeconds, 0);
                libssh2_keepalive_config(handle->session, 1, static_cast<unsigned>(interval));
            }
            return ConnectionOutcome::okay(
                std::make_unique<Libssh2Connection>(handle, method, request.keepaliveSeconds));
        }
        if (rc == kRetryTimedOut) {
            return failConnect(
                ErrorKind::Timeout, "SSH authentication to " + request.host + " timed out");
        }
        LOG_DEBUG(
            Session,
            "{} rejected for {}@{}: {}",
            method.describe(),
            request.user,
            request.host,
            handle->lastError(rc));
    }

    return failConnect(
        ErrorKind::Connection,
        "Authentication failed for " + request.user + "@" + request.host);
}

} // namespace Session
} // namespace BjornManager
