#pragma once

#include "core/ManagerError.h"
#include "session/LineSplitter.h"
#include "session/SshTransport.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace BjornManager {
namespace Session {

/**
 * @brief Line-by-line view of one running remote command.
 *
 * Finite and not restartable: nextLine() yields lines as they arrive, then nullopt once
 * the command has exited. stdout and stderr are merged. The channel is closed when the
 * stream ends for any reason, and at the latest when the stream is destroyed.
 */
class CommandStream {
public:
    // Sees every complete line and the unterminated tail; returns text to send to stdin.
    using PromptResponder = std::function<std::optional<std::string>(const std::string& text)>;

    CommandStream(
        std::unique_ptr<SshChannel> channel,
        std::chrono::milliseconds inactivityTimeout,
        std::function<void()> onClosed = nullptr);
    ~CommandStream();

    CommandStream(const CommandStream&) = delete;
    CommandStream& operator=(const CommandStream&) = delete;

    // Errors: Timeout when nothing arrives within the inactivity timeout, Cancelled after
    // cancel(), RemoteExecution on transport failure. The error repeats on later calls.
    Outcome<std::optional<std::string>> nextLine();

    // Thread-safe. Interrupts a pending read and closes the remote channel before returning.
    void cancel();

    VoidOutcome write(const std::string& data);
    void setPromptResponder(PromptResponder responder);

    std::optional<int> exitStatus() const;
    bool isCancelled() const { return cancelled_; }
    bool isFinished() const;

private:
    void finish(std::optional<ManagerError> error);
    void respondToPrompt(const std::string& text);

    std::unique_ptr<SshChannel> channel_;
    std::chrono::milliseconds inactivityTimeout_;
    std::function<void()> onClosed_;
    PromptResponder promptResponder_;

    LineSplitter splitter_;
    std::deque<std::string> pending_;

    mutable std::mutex ioMutex_;
    std::atomic<bool> cancelled_{ false };
    std::atomic<bool> finished_{ false };
    std::optional<ManagerError> terminalError_;
    std::optional<int> exitStatus_;
};

} // namespace Session
} // namespace BjornManager
