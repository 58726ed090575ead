#include "session/HostKeyVerifier.h"
#include "session/Libssh2Transport.h"
#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace BjornManager;
using namespace BjornManager::Session;

namespace {

// Loopback TCP listener that never accepts. The kernel still completes connects.
class SilentListener {
public:
    SilentListener()
    {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
            || ::listen(fd_, 4) != 0) {
            return;
        }
        socklen_t length = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &length) == 0) {
            port_ = ntohs(addr.sin_port);
        }
    }

    ~SilentListener() { close(); }

    void close()
    {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

ConnectRequest requestFor(int port, int timeoutMs)
{
    ConnectRequest request;
    request.host = "127.0.0.1";
    request.port = port;
    request.user = "bjorn";
    AuthMethod password;
    password.kind = AuthMethod::Kind::Password;
    password.secret = "raspberry";
    request.authMethods.push_back(password);
    request.timeoutMs = timeoutMs;
    return request;
}

} // namespace

TEST(Libssh2TransportTest, RefusedPortIsConnectionErrorNamingTheTarget)
{
    SilentListener listener;
    const int port = listener.port();
    ASSERT_GT(port, 0);
    listener.close();

    Libssh2Connector connector;
    AcceptAnyHostKey verifier;
    auto result = connector.connect(requestFor(port, 2000), verifier);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Connection);
    EXPECT_NE(
        result.errorValue().message.find("127.0.0.1:" + std::to_string(port)), std::string::npos);
}

TEST(Libssh2TransportTest, UnresolvableHostIsConnectionError)
{
    Libssh2Connector connector;
    AcceptAnyHostKey verifier;
    auto request = requestFor(22, 2000);
    request.host = "no-such-bjorn.invalid";

    auto result = connector.connect(request, verifier);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Connection);
    EXPECT_NE(result.errorValue().message.find("Cannot resolve"), std::string::npos);
}

TEST(Libssh2TransportTest, PeerThatNeverSpeaksSshTimesOut)
{
    SilentListener listener;
    ASSERT_GT(listener.port(), 0);

    Libssh2Connector connector;
    AcceptAnyHostKey verifier;
    auto result = connector.connect(requestFor(listener.port(), 500), verifier);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Timeout);
}

TEST(Libssh2TransportTest, EmptyCredentialsAreRejectedBeforeConnecting)
{
    Libssh2Connector connector;
    AcceptAnyHostKey verifier;
    auto request = requestFor(22, 500);
    request.authMethods.clear();

    auto result = connector.connect(request, verifier);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Connection);
}
