#include "events/UiEvent.h"
#include <gtest/gtest.h>

using namespace BjornManager;
using namespace BjornManager::Events;

TEST(UiEventTest, DeviceFoundSerializesEndpointAndAlias)
{
    const UiEvent event = DeviceFound{
        .identity = "bjorn",
        .alias = Alias{ 1 },
        .label = "Bjorn 1",
        .endpoint = { .address = "172.20.2.5", .interfaceClass = InterfaceClass::Usb },
    };

    const nlohmann::json j = event;
    EXPECT_EQ(j["event"], "deviceFound");
    EXPECT_EQ(j["alias"], 1);
    EXPECT_EQ(j["endpoint"]["address"], "172.20.2.5");
    EXPECT_EQ(j["endpoint"]["interfaceClass"], "USB");
}

TEST(UiEventTest, InstallFinishedIncludesErrorKindOnlyWhenSet)
{
    const UiEvent ok = InstallFinished{ .identity = "bjorn", .outcome = JobState::Succeeded };
    const nlohmann::json okJson = ok;
    EXPECT_EQ(okJson["outcome"], "Succeeded");
    EXPECT_FALSE(okJson.contains("errorKind"));

    const UiEvent failed = InstallFinished{
        .identity = "bjorn",
        .outcome = JobState::Failed,
        .errorKind = ErrorKind::RemoteExecution,
        .message = "exit status 2",
        .failureContext = { "E: apt failed" },
    };
    const nlohmann::json failedJson = failed;
    EXPECT_EQ(failedJson["errorKind"], "remote-execution");
    EXPECT_EQ(failedJson["failureContext"].size(), 1u);
}

TEST(UiEventTest, EventNameMatchesVocabulary)
{
    EXPECT_EQ(getEventName(SessionStateChanged{}), "sessionStateChanged");
    EXPECT_EQ(getEventName(InstallProgress{}), "installProgress");
    EXPECT_EQ(getEventName(WebUiStatusChanged{}), "webUiStatusChanged");
}
