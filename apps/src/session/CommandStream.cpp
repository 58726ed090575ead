#include "session/CommandStream.h"
#include "core/LoggingChannels.h"

namespace BjornManager {
namespace Session {

CommandStream::CommandStream(
    std::unique_ptr<SshChannel> channel,
    std::chrono::milliseconds inactivityTimeout,
    std::function<void()> onClosed)
    : channel_(std::move(channel)),
      inactivityTimeout_(inactivityTimeout),
      onClosed_(std::move(onClosed))
{}

CommandStream::~CommandStream()
{
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (!finished_) {
        finish(ManagerError(ErrorKind::Cancelled, "Stream abandoned"));
    }
}

Outcome<std::optional<std::string>> CommandStream::nextLine()
{
    using LineOutcome = Outcome<std::optional<std::string>>;
    std::lock_guard<std::mutex> lock(ioMutex_);

    while (true) {
        if (!pending_.empty()) {
            std::string line = std::move(pending_.front());
            pending_.pop_front();
            return LineOutcome::okay(std::move(line));
        }
        if (finished_) {
            if (terminalError_.has_value()) {
                return LineOutcome::error(terminalError_.value());
            }
            return LineOutcome::okay(std::nullopt);
        }
        if (cancelled_) {
            finish(ManagerError(ErrorKind::Cancelled, "Command cancelled"));
            continue;
        }

        const ChannelRead read = channel_->read(static_cast<int>(inactivityTimeout_.count()));
        switch (read.status) {
            case ReadStatus::Data: {
                for (auto& line : splitter_.push(read.stdoutData + read.stderrData)) {
                    respondToPrompt(line);
                    pending_.push_back(std::move(line));
                }
                if (!splitter_.partial().empty()) {
                    respondToPrompt(splitter_.partial());
                }
                break;
            }
            case ReadStatus::Eof: {
                std::string tail = splitter_.flush();
                if (!tail.empty()) {
                    pending_.push_back(std::move(tail));
                }
                finish(std::nullopt);
                break;
            }
            case ReadStatus::Timeout:
                LOG_WARN(
                    Session,
                    "No output for {} ms, closing command",
                    inactivityTimeout_.count());
                finish(ManagerError(
                    ErrorKind::Timeout,
                    "No output for " + std::to_string(inactivityTimeout_.count() / 1000)
                        + " s"));
                break;
            case ReadStatus::Interrupted:
                finish(ManagerError(ErrorKind::Cancelled, "Command cancelled"));
                break;
            case ReadStatus::Error:
                finish(ManagerError(ErrorKind::RemoteExecution, read.error));
                break;
        }
    }
}

void CommandStream::cancel()
{
    cancelled_ = true;
    channel_->interrupt();

    std::lock_guard<std::mutex> lock(ioMutex_);
    if (!finished_) {
        finish(ManagerError(ErrorKind::Cancelled, "Command cancelled"));
    }
}

VoidOutcome CommandStream::write(const std::string& data)
{
    if (finished_) {
        return failVoid(ErrorKind::RemoteExecution, "Command already finished");
    }
    return channel_->write(data);
}

void CommandStream::setPromptResponder(PromptResponder responder)
{
    promptResponder_ = std::move(responder);
}

std::optional<int> CommandStream::exitStatus() const
{
    std::lock_guard<std::mutex> lock(ioMutex_);
    return exitStatus_;
}

bool CommandStream::isFinished() const
{
    std::lock_guard<std::mutex> lock(ioMutex_);
    return finished_ && pending_.empty();
}

void CommandStream::finish(std::optional<ManagerError> error)
{
    channel_->close();
    exitStatus_ = channel_->exitStatus();
    terminalError_ = std::move(error);
    finished_ = true;
    if (terminalError_.has_value() && terminalError_->kind == ErrorKind::Cancelled) {
        pending_.clear();
    }

    if (onClosed_) {
        auto onClosed = std::move(onClosed_);
        onClosed_ = nullptr;
        onClosed();
    }
}

void CommandStream::respondToPrompt(const std::string& text)
{
    if (!promptResponder_) {
        return;
    }
    const auto answer = promptResponder_(text);
    if (!answer.has_value()) {
        return;
    }
    auto written = channel_->write(answer.value());
    if (written.isError()) {
        LOG_WARN(Session, "Could not answer prompt: {}", written.errorValue().message);
    }
}

} // namespace Session
} // namespace BjornManager
