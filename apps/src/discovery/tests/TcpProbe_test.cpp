#include "discovery/TcpProbe.h"
#include <cpp-httplib/httplib.h>
#include <gtest/gtest.h>
#include <thread>

using namespace BjornManager::Discovery;

namespace {

class LocalWebUi {
public:
    LocalWebUi()
    {
        server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content("not here", "text/plain");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LocalWebUi()
    {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
};

} // namespace

TEST(HttpStatusTest, HttpErrorStatusIsStillAnAnswer)
{
    LocalWebUi webUi;
    ASSERT_GT(webUi.port(), 0);

    const auto status = httpGetStatus("127.0.0.1", webUi.port(), "/", 1000);

    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value(), 404);
    EXPECT_TRUE(probeTcp("127.0.0.1", webUi.port(), 1000));
}

TEST(HttpStatusTest, ClosedPortGivesNoStatus)
{
    int closedPort = -1;
    {
        LocalWebUi webUi;
        closedPort = webUi.port();
    }
    ASSERT_GT(closedPort, 0);

    EXPECT_FALSE(httpGetStatus("127.0.0.1", closedPort, "/", 500).has_value());
    EXPECT_FALSE(probeTcp("127.0.0.1", closedPort, 500));
}

TEST(HttpStatusTest, UnparseableAddressGivesNoStatus)
{
    EXPECT_FALSE(probeTcp("not-an-address", 80, 100));
    EXPECT_FALSE(reverseLookup("999.1.1.1").has_value());
}
