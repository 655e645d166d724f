#include <gtest/gtest.h>

#include "ipc/endpoint.hpp"
#include "ipc/transport.hpp"
#include "util/temp_dir.hpp"
#include "util/test_client.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace mcpmux::ipc;
using namespace std::chrono_literals;
using mcpmux::test::TempDir;
using mcpmux::test::TestClient;
using nlohmann::json;

namespace
{

// Accepts connections on a unix socket and records what arrives.
class Acceptor : public TransportObserver
{
   public:
    Acceptor(EventLoop& loop, const std::string& path) : loop_(loop)
    {
        std::string bound;
        listen_fd_ = listen_endpoint(*parse_endpoint(path), bound);
        EXPECT_GE(listen_fd_, 0);
        watch_ = loop_.add(listen_fd_,
                           EventLoop::EVENT_READABLE,
                           [this](uint32_t)
                           {
                               int fd = accept_connection(listen_fd_);
                               if (fd >= 0)
                                   peers.push_back(std::make_unique<InboundTransport>(loop_, fd, *this));
                           });
    }

    ~Acceptor() override
    {
        loop_.remove(watch_);
        ::close(listen_fd_);
    }

    std::vector<std::unique_ptr<InboundTransport>> peers;
    std::vector<json>                              messages;
    std::vector<Envelope>                          controls;
    std::vector<std::string>                       errors;
    int                                            closed = 0;

    void on_message(Transport&, const json& payload) override { messages.push_back(payload); }
    void on_control(Transport&, const Envelope& env) override { controls.push_back(env); }
    void on_closed(Transport&) override { ++closed; }
    void on_error(Transport&, const std::string& message) override { errors.push_back(message); }

   private:
    EventLoop&        loop_;
    int               listen_fd_ = -1;
    EventLoop::WatchId watch_    = 0;
};

}   // namespace

class TransportTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.valid());
        path_     = dir_.file("t.sock");
        acceptor_ = std::make_unique<Acceptor>(loop_, path_);
    }

    bool wait(const std::function<bool()>& pred, std::chrono::milliseconds t = 2000ms)
    {
        return loop_.run_until(pred, t);
    }

    TempDir                   dir_;
    EventLoop                 loop_;
    std::string               path_;
    std::unique_ptr<Acceptor> acceptor_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Connect / send
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransportTest, ConnectAndExchange)
{
    TestClient client(loop_, path_);
    client.connect();
    EXPECT_TRUE(client.transport().is_open());
    ASSERT_TRUE(wait([&]() { return acceptor_->peers.size() == 1; }));

    client.send({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    client.transport().send_control(HeartbeatPayload{"s"});
    ASSERT_TRUE(wait([&]() { return acceptor_->messages.size() == 1 && acceptor_->controls.size() == 1; }));
    EXPECT_EQ(acceptor_->messages[0]["method"], "ping");
    EXPECT_EQ(std::get<HeartbeatPayload>(acceptor_->controls[0]).session_id, "s");

    acceptor_->peers[0]->send({{"jsonrpc", "2.0"}, {"id", 1}, {"result", {}}});
    ASSERT_TRUE(client.wait_messages(1));
    EXPECT_EQ(client.messages[0]["id"], 1);
}

TEST_F(TransportTest, MessagesArriveInOrder)
{
    TestClient client(loop_, path_);
    client.connect();

    for (int i = 0; i < 500; ++i)
        client.send({{"jsonrpc", "2.0"}, {"method", "n"}, {"params", {{"i", i}}}});

    ASSERT_TRUE(wait([&]() { return acceptor_->messages.size() == 500; }, 5000ms));
    for (int i = 0; i < 500; ++i)
        EXPECT_EQ(acceptor_->messages[i]["params"]["i"], i);
}

TEST_F(TransportTest, LargePayloadIsBufferedAndFlushed)
{
    TestClient client(loop_, path_);
    client.connect();

    std::string big(4 * 1024 * 1024, 'x');
    client.send({{"blob", big}});
    ASSERT_TRUE(wait([&]() { return acceptor_->messages.size() == 1; }, 5000ms));
    EXPECT_EQ(acceptor_->messages[0]["blob"].get<std::string>().size(), big.size());
    EXPECT_EQ(client.transport().pending_output(), 0u);
}

TEST_F(TransportTest, SendControlRejectsMcp)
{
    TestClient client(loop_, path_);
    client.connect();
    EXPECT_THROW(client.transport().send_control(McpPayload{json::object()}), std::invalid_argument);
}

TEST_F(TransportTest, SendBeforeConnectThrows)
{
    TestClient client(loop_, path_);
    EXPECT_THROW(client.send({{"a", 1}}), TransportError);
}

TEST(Transport, ConnectToMissingSocketFails)
{
    TempDir    dir;
    EventLoop  loop;
    TestClient client(loop, dir.file("missing.sock"));
    try
    {
        client.connect();
        FAIL() << "expected TransportError";
    }
    catch (const TransportError& e)
    {
        EXPECT_NE(std::string(e.what()).find("Failed to connect"), std::string::npos);
    }
    EXPECT_FALSE(client.closed);
}

TEST(Transport, InvalidEndpointFails)
{
    EventLoop  loop;
    TestClient client(loop, "tcp://nohost");
    EXPECT_THROW(client.connect(), TransportError);
}

TEST(Transport, ConnectTimesOutWhenListenerNeverAnswers)
{
    // A loopback listener with a full accept queue drops further SYNs, so a
    // non-blocking connect stays in progress.
    int listener = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener, 0), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    std::string endpoint = "tcp://127.0.0.1:" + std::to_string(ntohs(addr.sin_port));

    std::vector<int> fillers;
    for (int i = 0; i < 4; ++i)
    {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
        ASSERT_GE(fd, 0);
        ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        fillers.push_back(fd);
    }
    std::this_thread::sleep_for(50ms);

    EventLoop  loop;
    TestClient client(loop, endpoint);
    auto       t0 = std::chrono::steady_clock::now();
    try
    {
        client.transport().start(200ms);
        FAIL() << "expected TransportError";
    }
    catch (const TransportError& e)
    {
        EXPECT_STREQ(e.what(), "Connection timeout after 200ms");
    }
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 200ms);
    EXPECT_TRUE(client.transport().is_closed());
    EXPECT_FALSE(client.closed);

    for (int fd : fillers)
        ::close(fd);
    ::close(listener);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Close
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransportTest, GracefulCloseDeliversPendingThenNotifiesBoth)
{
    TestClient client(loop_, path_);
    client.connect();
    ASSERT_TRUE(wait([&]() { return acceptor_->peers.size() == 1; }));

    client.send({{"last", true}});
    client.transport().close();
    EXPECT_THROW(client.send({{"late", true}}), TransportError);

    ASSERT_TRUE(wait([&]() { return acceptor_->closed == 1; }));
    ASSERT_EQ(acceptor_->messages.size(), 1u);
    EXPECT_EQ(acceptor_->messages[0]["last"], true);

    // Peer closed in response, which completes our close before the linger.
    ASSERT_TRUE(client.wait_closed());
    EXPECT_TRUE(client.transport().is_closed());
}

TEST_F(TransportTest, LingerCompletesCloseWhenPeerStaysOpen)
{
    // Raw peer that never closes.
    TestClient client(loop_, path_);
    client.connect();
    ASSERT_TRUE(wait([&]() { return acceptor_->peers.size() == 1; }));

    // Stop the inbound side from reacting to EOF by detaching it.
    int peer_fd = ::dup(acceptor_->peers[0]->fd());
    acceptor_->peers.clear();

    client.transport().close();
    EXPECT_FALSE(client.closed);
    ASSERT_TRUE(client.wait_closed(Transport::CLOSE_LINGER + 1000ms));
    ::close(peer_fd);
}

TEST_F(TransportTest, ClosedFiresOnceOnPeerDisconnect)
{
    TestClient client(loop_, path_);
    client.connect();
    ASSERT_TRUE(wait([&]() { return acceptor_->peers.size() == 1; }));

    acceptor_->peers[0]->destroy();
    EXPECT_EQ(acceptor_->closed, 1);
    acceptor_->peers[0]->destroy();
    EXPECT_EQ(acceptor_->closed, 1);

    ASSERT_TRUE(client.wait_closed());
    EXPECT_TRUE(client.errors.empty());
}

TEST_F(TransportTest, OversizedFrameClosesWithError)
{
    TestClient client(loop_, path_);
    client.connect();
    ASSERT_TRUE(wait([&]() { return acceptor_->peers.size() == 1; }));

    uint8_t header[4] = {0x7F, 0xFF, 0xFF, 0xFF};
    ASSERT_EQ(::send(client.transport().fd(), header, 4, MSG_NOSIGNAL), 4);

    ASSERT_TRUE(wait([&]() { return acceptor_->closed == 1; }));
    ASSERT_EQ(acceptor_->errors.size(), 1u);
    EXPECT_NE(acceptor_->errors[0].find("maximum"), std::string::npos);
}

TEST_F(TransportTest, MalformedFrameSkipped)
{
    TestClient client(loop_, path_);
    client.connect();
    ASSERT_TRUE(wait([&]() { return acceptor_->peers.size() == 1; }));

    const char junk[] = "\0\0\0\x03" "abc";
    ASSERT_EQ(::send(client.transport().fd(), junk, 7, MSG_NOSIGNAL), 7);
    client.send({{"after", 1}});

    ASSERT_TRUE(wait([&]() { return acceptor_->messages.size() == 1; }));
    EXPECT_EQ(acceptor_->messages[0]["after"], 1);
    EXPECT_EQ(acceptor_->closed, 0);
}

TEST_F(TransportTest, TcpEndpoint)
{
    EventLoop   loop;
    std::string bound;
    int         fd = listen_endpoint(*parse_endpoint("tcp://127.0.0.1:0"), bound);
    ASSERT_GE(fd, 0);

    TestClient client(loop, bound);
    client.connect();
    EXPECT_TRUE(client.transport().is_open());
    EXPECT_EQ(client.transport().endpoint(), bound);
    ::close(fd);
}
