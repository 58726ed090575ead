#pragma once

#include "session/HostKeyVerifier.h"
#include "session/SshTransport.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace BjornManager {
namespace Session {
namespace Testing {

// Script and observations of one fake remote command.
struct FakeChannelState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ChannelRead> script;
    // Eof is returned once the script is drained; otherwise reads block until timeout.
    bool eofAfterScript = true;
    int exitStatus = 0;

    std::string command;
    bool pty = false;
    std::string written;
    bool eofSent = false;
    bool closed = false;
    bool interrupted = false;

    void pushOutput(const std::string& text)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ChannelRead read;
            read.status = ReadStatus::Data;
            read.stdoutData = text;
            script.push_back(read);
        }
        cv.notify_all();
    }

    void finishWithExit(int status)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            exitStatus = status;
            eofAfterScript = true;
        }
        cv.notify_all();
    }

    bool isClosed()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }
};

class FakeChannel : public SshChannel {
public:
    explicit FakeChannel(std::shared_ptr<FakeChannelState> state) : state_(std::move(state)) {}
    ~FakeChannel() override { close(); }

    ChannelRead read(int timeoutMs) override
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
            return state_->interrupted || state_->closed || !state_->script.empty()
                || state_->eofAfterScript;
        });

        ChannelRead result;
        if (state_->interrupted) {
            result.status = ReadStatus::Interrupted;
        }
        else if (state_->closed) {
            result.status = ReadStatus::Error;
            result.error = "closed";
        }
        else if (!state_->script.empty()) {
            result = state_->script.front();
            state_->script.pop_front();
        }
        else if (state_->eofAfterScript) {
            result.status = ReadStatus::Eof;
        }
        else {
            result.status = ReadStatus::Timeout;
        }
        return result;
    }

    VoidOutcome write(const std::string& data) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->written += data;
        return okayVoid();
    }

    void sendEof() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->eofSent = true;
    }

    void close() override
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) {
                return;
            }
            state_->closed = true;
            if (!state_->interrupted) {
                exitStatus_ = state_->exitStatus;
            }
        }
        state_->cv.notify_all();
    }

    std::optional<int> exitStatus() const override { return exitStatus_; }

    void interrupt() override
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->interrupted = true;
        }
        state_->cv.notify_all();
    }

private:
    std::shared_ptr<FakeChannelState> state_;
    std::optional<int> exitStatus_;
};

struct FakeUpload {
    std::string content;
    int mode = 0;
};

struct FakeConnectionState {
    std::mutex mutex;
    std::deque<std::shared_ptr<FakeChannelState>> nextChannels;
    std::vector<std::shared_ptr<FakeChannelState>> opened;
    std::map<std::string, FakeUpload> uploads;
    std::vector<std::string> uploadOrder;
    std::set<std::string> failingUploads;
    bool connected = true;
    int disconnectCount = 0;

    // Queues a channel for the next openExec; unscripted commands exit 0 with no output.
    std::shared_ptr<FakeChannelState> expectCommand()
    {
        auto channel = std::make_shared<FakeChannelState>();
        std::lock_guard<std::mutex> lock(mutex);
        nextChannels.push_back(channel);
        return channel;
    }

    std::vector<std::string> commands()
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> result;
        for (const auto& channel : opened) {
            result.push_back(channel->command);
        }
        return result;
    }
};

class FakeConnection : public SshConnection {
public:
    FakeConnection(std::shared_ptr<FakeConnectionState> state, AuthMethod auth)
        : state_(std::move(state)), auth_(std::move(auth))
    {}

    Outcome<std::unique_ptr<SshChannel>> openExec(const std::string& command, bool pty) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->connected) {
            return fail<std::unique_ptr<SshChannel>>(ErrorKind::NotConnected, "Not connected");
        }
        std::shared_ptr<FakeChannelState> channel;
        if (state_->nextChannels.empty()) {
            channel = std::make_shared<FakeChannelState>();
        }
        else {
            channel = state_->nextChannels.front();
            state_->nextChannels.pop_front();
        }
        channel->command = command;
        channel->pty = pty;
        state_->opened.push_back(channel);
        return Outcome<std::unique_ptr<SshChannel>>::okay(std::make_unique<FakeChannel>(channel));
    }

    VoidOutcome sendFile(
        const std::string& content, const std::string& remotePath, int mode, int) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->failingUploads.count(remotePath)) {
            return failVoid(ErrorKind::Transfer, "Upload of " + remotePath + " failed");
        }
        state_->uploads[remotePath] = FakeUpload{ content, mode };
        state_->uploadOrder.push_back(remotePath);
        return okayVoid();
    }

    const AuthMethod& authenticatedWith() const override { return auth_; }

    void disconnect() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->connected = false;
        ++state_->disconnectCount;
    }

    bool isConnected() const override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->connected;
    }

private:
    std::shared_ptr<FakeConnectionState> state_;
    AuthMethod auth_;
};

// Accepts the listed key files and password; everything else is rejected.
class FakeConnector : public SshConnector {
public:
    Outcome<std::unique_ptr<SshConnection>> connect(
        const ConnectRequest& request, HostKeyVerifier& verifier) override
    {
        if (beforeConnect) {
            beforeConnect();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (unreachable) {
            return fail<std::unique_ptr<SshConnection>>(
                ErrorKind::Connection, "Failed to connect to " + request.host);
        }

        auto verified = verifier.verify(request.host, request.port, hostKey);
        if (verified.isError()) {
            return Outcome<std::unique_ptr<SshConnection>>::error(verified.errorValue());
        }

        for (const auto& method : request.authMethods) {
            const bool accepted = method.kind == AuthMethod::Kind::Password
                ? method.secret == acceptedPassword && !acceptedPassword.empty()
                : acceptedKeys.count(method.keyPath.string()) > 0;
            if (accepted) {
                connection = std::make_shared<FakeConnectionState>();
                if (prepare) {
                    prepare(*connection);
                }
                return Outcome<std::unique_ptr<SshConnection>>::okay(
                    std::make_unique<FakeConnection>(connection, method));
            }
        }
        return fail<std::unique_ptr<SshConnection>>(
            ErrorKind::Connection, "Authentication failed for " + request.user);
    }

    std::vector<ConnectRequest> recordedRequests()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests;
    }

    std::set<std::string> acceptedKeys;
    std::string acceptedPassword;
    bool unreachable = false;
    HostKey hostKey{ "ssh-ed25519", "host-key-bytes" };
    // Runs unlocked at the start of every connect() call.
    std::function<void()> beforeConnect;
    // Runs on each new connection before it is handed out.
    std::function<void(FakeConnectionState&)> prepare;

    std::shared_ptr<FakeConnectionState> connection;
    std::vector<ConnectRequest> requests;

private:
    std::mutex mutex_;
};

} // namespace Testing
} // namespace Session
} // namespace BjornManager
