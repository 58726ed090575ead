#include "session/CommandStream.h"
#include "session/tests/FakeSsh.h"
#include <gtest/gtest.h>
#include <thread>

using namespace BjornManager;
using namespace BjornManager::Session;
using namespace BjornManager::Session::Testing;
using namespace std::chrono_literals;

TEST(CommandStreamTest, YieldsLinesThenEndWithExitStatus)
{
    auto state = std::make_shared<FakeChannelState>();
    state->pushOutput("Step 1 of 2: Upd");
    state->pushOutput("ating\nStep 2 of 2: Done\npartial");
    state->exitStatus = 3;

    int closedCalls = 0;
    CommandStream stream(std::make_unique<FakeChannel>(state), 1s, [&] { ++closedCalls; });

    EXPECT_EQ(stream.nextLine().value(), "Step 1 of 2: Updating");
    EXPECT_EQ(stream.nextLine().value(), "Step 2 of 2: Done");
    EXPECT_EQ(stream.nextLine().value(), "partial");
    auto end = stream.nextLine();
    ASSERT_TRUE(end.isValue());
    EXPECT_FALSE(end.value().has_value());

    EXPECT_EQ(stream.exitStatus(), 3);
    EXPECT_TRUE(state->isClosed());
    EXPECT_EQ(closedCalls, 1);
    EXPECT_TRUE(stream.isFinished());
}

TEST(CommandStreamTest, SilenceBeyondInactivityTimeoutIsTimeout)
{
    auto state = std::make_shared<FakeChannelState>();
    state->eofAfterScript = false;
    CommandStream stream(std::make_unique<FakeChannel>(state), 50ms);

    auto result = stream.nextLine();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Timeout);
    EXPECT_TRUE(state->isClosed());

    // The terminal error repeats.
    EXPECT_EQ(stream.nextLine().errorValue().kind, ErrorKind::Timeout);
}

TEST(CommandStreamTest, CancelUnblocksPendingReadAndClosesChannel)
{
    auto state = std::make_shared<FakeChannelState>();
    state->eofAfterScript = false;
    CommandStream stream(std::make_unique<FakeChannel>(state), std::chrono::hours(1));

    std::optional<ErrorKind> readerError;
    std::thread reader([&] {
        auto result = stream.nextLine();
        if (result.isError()) {
            readerError = result.errorValue().kind;
        }
    });

    std::this_thread::sleep_for(50ms);
    const auto before = std::chrono::steady_clock::now();
    stream.cancel();
    reader.join();

    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
    EXPECT_EQ(readerError, ErrorKind::Cancelled);
    EXPECT_TRUE(state->isClosed());
    EXPECT_TRUE(stream.isCancelled());
    EXPECT_FALSE(stream.exitStatus().has_value());
}

TEST(CommandStreamTest, PromptResponderAnswersUnterminatedPrompt)
{
    auto state = std::make_shared<FakeChannelState>();
    state->pushOutput("[sudo] password for bjorn: ");
    state->pushOutput("\nStep 1 of 1: Go\n");

    CommandStream stream(std::make_unique<FakeChannel>(state), 1s);
    int answers = 0;
    stream.setPromptResponder([&](const std::string& text) -> std::optional<std::string> {
        if (answers == 0 && text.find("[sudo]") != std::string::npos) {
            ++answers;
            return std::string("secret\n");
        }
        return std::nullopt;
    });

    EXPECT_EQ(stream.nextLine().value(), "[sudo] password for bjorn: ");
    EXPECT_EQ(stream.nextLine().value(), "Step 1 of 1: Go");
    EXPECT_EQ(answers, 1);
    std::lock_guard<std::mutex> lock(state->mutex);
    EXPECT_EQ(state->written, "secret\n");
}

TEST(CommandStreamTest, TransportErrorIsRemoteExecution)
{
    auto state = std::make_shared<FakeChannelState>();
    ChannelRead broken;
    broken.status = ReadStatus::Error;
    broken.error = "socket reset";
    state->script.push_back(broken);

    CommandStream stream(std::make_unique<FakeChannel>(state), 1s);
    auto result = stream.nextLine();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::RemoteExecution);
    EXPECT_EQ(result.errorValue().message, "socket reset");
}

TEST(CommandStreamTest, DestroyingUnfinishedStreamClosesChannel)
{
    auto state = std::make_shared<FakeChannelState>();
    state->eofAfterScript = false;
    bool closed = false;
    {
        CommandStream stream(std::make_unique<FakeChannel>(state), 1s, [&] { closed = true; });
    }
    EXPECT_TRUE(closed);
    EXPECT_TRUE(state->isClosed());
}
