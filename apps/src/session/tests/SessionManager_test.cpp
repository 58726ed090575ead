#include "events/tests/RecordingEventSink.h"
#include "session/SessionManager.h"
#include "session/tests/FakeSsh.h"
#include <gtest/gtest.h>

using namespace BjornManager;
using namespace BjornManager::Session;
using namespace BjornManager::Session::Testing;
using BjornManager::Events::Testing::RecordingEventSink;

namespace {

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        connector_ = std::make_shared<FakeConnector>();
        connector_->acceptedPassword = "raspberry";
        manager_ = std::make_unique<SessionManager>(
            SessionConfig{},
            connector_,
            std::make_shared<AcceptAnyHostKey>(),
            events_,
            std::filesystem::temp_directory_path() / "bjorn-no-keys");
        credentials_.password = "raspberry";
    }

    RecordingEventSink events_;
    std::shared_ptr<FakeConnector> connector_;
    std::unique_ptr<SessionManager> manager_;
    Credentials credentials_;
};

} // namespace

TEST_F(SessionManagerTest, SessionIsCreatedOncePerIdentity)
{
    auto first = manager_->session("bjorn");
    auto again = manager_->session("bjorn");
    EXPECT_EQ(first.get(), again.get());
    EXPECT_EQ(manager_->find("bjorn-2"), nullptr);
    EXPECT_EQ(manager_->identities(), (std::vector<DeviceIdentity>{ "bjorn" }));
}

TEST_F(SessionManagerTest, BusyDeviceDoesNotBlockAnother)
{
    ASSERT_TRUE(manager_->connect("bjorn", "192.168.1.20", credentials_).isValue());
    auto firstConnection = connector_->connection;
    auto longRunning = firstConnection->expectCommand();
    longRunning->eofAfterScript = false;
    auto stream = manager_->session("bjorn")->execute("long-running");
    ASSERT_TRUE(stream.isValue());

    ASSERT_TRUE(manager_->connect("bjorn-2", "192.168.1.21", credentials_).isValue());
    auto result = manager_->session("bjorn-2")->executeSimple("uptime");
    EXPECT_TRUE(result.isValue());

    auto busy = manager_->session("bjorn")->executeSimple("uptime");
    EXPECT_EQ(busy.errorValue().kind, ErrorKind::Busy);
    stream.value()->cancel();
}

TEST_F(SessionManagerTest, DisconnectAffectsOnlyThatDevice)
{
    ASSERT_TRUE(manager_->connect("bjorn", "192.168.1.20", credentials_).isValue());
    ASSERT_TRUE(manager_->connect("bjorn-2", "192.168.1.21", credentials_).isValue());

    manager_->disconnect("bjorn");
    EXPECT_EQ(manager_->find("bjorn")->state(), SessionState::Disconnected);
    EXPECT_EQ(manager_->find("bjorn-2")->state(), SessionState::Connected);

    manager_->disconnectAll();
    EXPECT_EQ(manager_->find("bjorn-2")->state(), SessionState::Disconnected);
}
