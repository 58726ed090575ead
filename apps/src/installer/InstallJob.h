#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerError.h"
#include "installer/ProgressParser.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Installer {

struct StepRecord {
    int index = 0;
    std::string label;
    JobState outcome = JobState::Running;
};

struct InstallJobSnapshot {
    DeviceIdentity identity;
    JobState state = JobState::Pending;
    int currentStepIndex = 0;
    int stepTotal = 0;
    // Ordered by step index.
    std::vector<StepRecord> steps;
    std::optional<ManagerError> error;
    std::vector<std::string> failureContext;
};

/**
 * @brief One run of the remote install protocol on one device.
 *
 * Pending until started, Running while the remote script streams, then exactly one of
 * Succeeded, Failed or Aborted. Terminal states are final. Safe to read from other threads.
 */
class InstallJob {
public:
    InstallJob(DeviceIdentity identity, size_t failureContextLines);

    const DeviceIdentity& identity() const { return identity_; }

    void start();

    // Returns what the line contributes. Lines after a terminal state are ignored.
    LineOutcome consumeLine(const std::string& line);

    void succeed();
    void fail(ManagerError error);
    void abort(const std::string& reason);

    JobState state() const;
    bool isTerminal() const;
    InstallJobSnapshot snapshot() const;

private:
    void recordStep(const StepProgress& progress);
    void closeSteps(JobState currentOutcome);
    bool finishLocked(JobState state);

    DeviceIdentity identity_;
    mutable std::mutex mutex_;
    JobState state_ = JobState::Pending;
    ProgressState progress_;
    std::vector<StepRecord> steps_;
    std::optional<ManagerError> error_;
};

} // namespace Installer
} // namespace BjornManager
