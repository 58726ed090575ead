#include "installer/InstallJob.h"
#include "core/LoggingChannels.h"
#include <algorithm>

namespace BjornManager {
namespace Installer {

InstallJob::InstallJob(DeviceIdentity identity, size_t failureContextLines)
    : identity_(std::move(identity))
{
    progress_.maxRecentLines = failureContextLines;
}

void InstallJob::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == JobState::Pending) {
        state_ = JobState::Running;
    }
}

LineOutcome InstallJob::consumeLine(const std::string& line)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != JobState::Running) {
        return LineOutcome{ progress_, std::nullopt, std::nullopt };
    }

    LineOutcome outcome = advanceProgress(std::move(progress_), line);
    progress_ = outcome.state;
    if (outcome.progress.has_value()) {
        recordStep(outcome.progress.value());
    }
    return outcome;
}

void InstallJob::succeed()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (finishLocked(JobState::Succeeded)) {
        closeSteps(JobState::Succeeded);
    }
}

void InstallJob::fail(ManagerError error)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (finishLocked(JobState::Failed)) {
        error_ = std::move(error);
        closeSteps(JobState::Failed);
    }
}

void InstallJob::abort(const std::string& reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (finishLocked(JobState::Aborted)) {
        error_ = ManagerError(ErrorKind::Cancelled, reason);
        closeSteps(JobState::Aborted);
    }
}

JobState InstallJob::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool InstallJob::isTerminal() const
{
    const JobState current = state();
    return current == JobState::Succeeded || current == JobState::Failed
        || current == JobState::Aborted;
}

InstallJobSnapshot InstallJob::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    InstallJobSnapshot snap;
    snap.identity = identity_;
    snap.state = state_;
    snap.currentStepIndex = progress_.stepIndex;
    snap.stepTotal = progress_.stepTotal;
    snap.steps = steps_;
    snap.error = error_;
    if (state_ == JobState::Failed) {
        snap.failureContext = failureContext(progress_);
    }
    return snap;
}

void InstallJob::recordStep(const StepProgress& progress)
{
    // Everything still running before the newly reported step has finished.
    for (auto& step : steps_) {
        if (step.outcome == JobState::Running && step.index != progress.index) {
            step.outcome = JobState::Succeeded;
        }
    }

    auto it = std::find_if(steps_.begin(), steps_.end(), [&](const StepRecord& step) {
        return step.index == progress.index;
    });
    if (it != steps_.end()) {
        it->label = progress.label;
        it->outcome = JobState::Running;
        return;
    }

    StepRecord record;
    record.index = progress.index;
    record.label = progress.label;
    auto position = std::upper_bound(
        steps_.begin(), steps_.end(), record, [](const StepRecord& a, const StepRecord& b) {
            return a.index < b.index;
        });
    steps_.insert(position, record);
}

void InstallJob::closeSteps(JobState currentOutcome)
{
    for (auto& step : steps_) {
        if (step.outcome != JobState::Running) {
            continue;
        }
        step.outcome =
            step.index == progress_.stepIndex ? currentOutcome : JobState::Succeeded;
    }
}

bool InstallJob::finishLocked(JobState state)
{
    if (state_ == JobState::Succeeded || state_ == JobState::Failed
        || state_ == JobState::Aborted) {
        LOG_DEBUG(Install, "Job for '{}' already {}", identity_, toString(state_));
        return false;
    }
    state_ = state;
    return true;
}

} // namespace Installer
} // namespace BjornManager
