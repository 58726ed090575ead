#include "installer/InstallJob.h"
#include <gtest/gtest.h>

using namespace BjornManager;
using namespace BjornManager::Installer;

TEST(InstallJobTest, LinesAreIgnoredUntilStarted)
{
    InstallJob job("bjorn", 5);
    EXPECT_EQ(job.state(), JobState::Pending);
    job.consumeLine("Step 1 of 2: Early");
    EXPECT_EQ(job.snapshot().currentStepIndex, 0);
}

TEST(InstallJobTest, StepsCloseAsLaterStepsArrive)
{
    InstallJob job("bjorn", 5);
    job.start();
    job.consumeLine("Step 1 of 3: One");
    job.consumeLine("Step 3 of 3: Three");
    job.consumeLine("Step 2 of 3: Two, reported late");

    const auto snapshot = job.snapshot();
    EXPECT_EQ(snapshot.state, JobState::Running);
    EXPECT_EQ(snapshot.currentStepIndex, 2);
    ASSERT_EQ(snapshot.steps.size(), 3u);
    EXPECT_EQ(snapshot.steps[0].index, 1);
    EXPECT_EQ(snapshot.steps[0].outcome, JobState::Succeeded);
    EXPECT_EQ(snapshot.steps[1].index, 2);
    EXPECT_EQ(snapshot.steps[1].outcome, JobState::Running);
    EXPECT_EQ(snapshot.steps[2].index, 3);
    EXPECT_EQ(snapshot.steps[2].outcome, JobState::Succeeded);
}

TEST(InstallJobTest, FailureMarksCurrentStepAndKeepsContext)
{
    InstallJob job("bjorn", 2);
    job.start();
    job.consumeLine("Step 1 of 2: One");
    job.consumeLine("pip: error");
    job.consumeLine("giving up");
    job.fail(ManagerError(ErrorKind::RemoteExecution, "exit 1"));

    const auto snapshot = job.snapshot();
    EXPECT_EQ(snapshot.state, JobState::Failed);
    EXPECT_EQ(snapshot.steps[0].outcome, JobState::Failed);
    EXPECT_EQ(snapshot.failureContext, (std::vector<std::string>{ "pip: error", "giving up" }));
    EXPECT_EQ(snapshot.error->message, "exit 1");
}

TEST(InstallJobTest, TerminalStateIsFinal)
{
    InstallJob job("bjorn", 5);
    job.start();
    job.abort("cancelled by operator");
    job.succeed();
    job.fail(ManagerError(ErrorKind::Timeout, "late"));

    EXPECT_EQ(job.state(), JobState::Aborted);
    EXPECT_TRUE(job.isTerminal());
    EXPECT_EQ(job.snapshot().error->kind, ErrorKind::Cancelled);
    EXPECT_TRUE(job.snapshot().failureContext.empty());
}
