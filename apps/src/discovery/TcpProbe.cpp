#include "discovery/TcpProbe.h"
#include "core/LoggingChannels.h"
#include <cpp-httplib/httplib.h>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace BjornManager {
namespace Discovery {

namespace {

struct SocketCloser {
    int fd = -1;

    ~SocketCloser()
    {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

int remainingMs(const std::chrono::steady_clock::time_point& deadline)
{
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return 0;
    }
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

bool waitFor(int fd, short events, int timeoutMs)
{
    if (timeoutMs <= 0) {
        return false;
    }
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int rc = 0;
    do {
        rc = poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);
    return rc > 0;
}

// Non-blocking connect bounded by deadline. Returns the connected fd or -1.
int connectWithDeadline(
    const std::string& address, int port, const std::chrono::steady_clock::time_point& deadline)
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return -1;
    }

    SocketCloser socket;
    socket.fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket.fd < 0) {
        return -1;
    }

    const int flags = fcntl(socket.fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(socket.fd, F_SETFL, flags | O_NONBLOCK);
    }

    if (::connect(socket.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno != EINPROGRESS) {
            return -1;
        }
        if (!waitFor(socket.fd, POLLOUT, remainingMs(deadline))) {
            return -1;
        }
        int socketError = 0;
        socklen_t socketErrorLen = sizeof(socketError);
        if (getsockopt(socket.fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen) != 0
            || socketError != 0) {
            return -1;
        }
    }

    const int fd = socket.fd;
    socket.fd = -1;
    return fd;
}

} // namespace

bool probeTcp(const std::string& address, int port, int timeoutMs)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    SocketCloser socket;
    socket.fd = connectWithDeadline(address, port, deadline);
    return socket.fd >= 0;
}

std::optional<std::string> reverseLookup(const std::string& address)
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    const int rc = getnameinfo(
        reinterpret_cast<sockaddr*>(&addr),
        sizeof(addr),
        host,
        sizeof(host),
        nullptr,
        0,
        NI_NAMEREQD);
    if (rc != 0) {
        return std::nullopt;
    }
    return std::string(host);
}

std::optional<int> httpGetStatus(
    const std::string& address, int port, const std::string& path, int timeoutMs)
{
    const auto timeout = std::chrono::milliseconds(timeoutMs);
    httplib::Client client(address, port);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_keep_alive(false);

    const auto res = client.Get(path);
    if (!res) {
        LOG_TRACE(
            Discovery,
            "GET http://{}:{}{} failed: {}",
            address,
            port,
            path,
            httplib::to_string(res.error()));
        return std::nullopt;
    }
    return res->status;
}

} // namespace Discovery
} // namespace BjornManager
