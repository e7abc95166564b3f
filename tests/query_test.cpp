#include "motd/query.hpp"

#include "motd/net/udp_exchange.hpp"
#include "pong_fixture.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

// Loopback UDP socket standing in for a Bedrock server.
class FakeServer {
public:
    FakeServer() {
        fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd >= 0 && bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
            socklen_t length = sizeof(addr);
            getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &length);
            port = ntohs(addr.sin_port);
        }
    }

    ~FakeServer() {
        if (worker.joinable()) {
            worker.join();
        }
        if (fd >= 0) {
            close(fd);
        }
    }

    FakeServer(const FakeServer&) = delete;
    FakeServer& operator=(const FakeServer&) = delete;

    // Answers the next datagram with `reply` and records what it received.
    void answerOnce(std::vector<uint8_t> reply) {
        worker = std::thread([this, reply = std::move(reply)] {
            std::vector<uint8_t> buffer(2048);
            sockaddr_in from{};
            socklen_t fromLength = sizeof(from);
            const auto received = recvfrom(fd, buffer.data(), buffer.size(), 0,
                                           reinterpret_cast<sockaddr *>(&from), &fromLength);
            if (received < 0) {
                return;
            }
            buffer.resize(static_cast<std::size_t>(received));
            request = buffer;
            sendto(fd, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr *>(&from), fromLength);
            answered = true;
        });
    }

    std::string address() const {
        return "127.0.0.1:" + std::to_string(port);
    }

    int fd = -1;
    uint16_t port = 0;
    std::thread worker;
    std::vector<uint8_t> request;
    std::atomic<bool> answered{false};
};

motd::QueryOptions ShortTimeout() {
    motd::QueryOptions options;
    options.timeout = std::chrono::milliseconds(2000);
    return options;
}

} // namespace

TEST(QueryTest, FetchUnconnectedPongOverLoopback) {
    FakeServer server;
    ASSERT_NE(server.port, 0);
    server.answerOnce(motd::test::MakePong(motd::test::FULL_SERVER_ID_STRING, 5000, 99));

    motd::MotdError error;
    const auto pong = motd::FetchUnconnectedPong(server.address(), ShortTimeout(), &error);
    ASSERT_TRUE(pong.has_value()) << error.message;
    server.worker.join();

    EXPECT_TRUE(server.answered.load());
    const auto ping = motd::protocol::BuildUnconnectedPing();
    EXPECT_EQ(server.request, std::vector<uint8_t>(ping.begin(), ping.end()));

    EXPECT_EQ(pong->timeSinceStart, 5000);
    EXPECT_EQ(pong->serverGuid, 99);
    EXPECT_TRUE(pong->serverIdStringParsedOk);
    EXPECT_EQ(pong->serverIdString.motd, "Dedicated Server");
}

TEST(QueryTest, FetchServerIdStringProjectsStatus) {
    FakeServer server;
    ASSERT_NE(server.port, 0);
    server.answerOnce(motd::test::MakePong("MCPE;My Server;618;1.20.40;5;20"));

    motd::MotdError error;
    const auto status = motd::FetchServerIdString(server.address(), ShortTimeout(), &error);
    ASSERT_TRUE(status.has_value()) << error.message;
    EXPECT_EQ(status->playerCount, 5);
    EXPECT_EQ(status->maxPlayerCount, 20);
    EXPECT_EQ(status->portV4, 19132);
}

TEST(QueryTest, DecodeErrorsReachCaller) {
    FakeServer server;
    ASSERT_NE(server.port, 0);
    server.answerOnce({0x1c, 0x00, 0x01});

    motd::MotdError error;
    EXPECT_FALSE(motd::FetchUnconnectedPong(server.address(), ShortTimeout(), &error).has_value());
    EXPECT_EQ(error.code, motd::MotdErrorCode::Truncated);
}

TEST(QueryTest, SilentServerTimesOut) {
    FakeServer server;
    ASSERT_NE(server.port, 0);

    motd::QueryOptions options;
    options.timeout = std::chrono::milliseconds(150);

    motd::MotdError error;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(motd::FetchUnconnectedPong(server.address(), options, &error).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(error.code, motd::MotdErrorCode::Timeout);
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
}

TEST(QueryTest, UnresolvableAddressIsSendFailure) {
    motd::MotdError error;
    EXPECT_FALSE(motd::FetchUnconnectedPong("127.0.0.1:bad", ShortTimeout(), &error).has_value());
    EXPECT_EQ(error.code, motd::MotdErrorCode::CantSendTo);
}

TEST(UdpExchangeTest, OpenBindsEphemeralPort) {
    motd::net::UdpExchange exchange;
    EXPECT_FALSE(exchange.isOpen());
    ASSERT_TRUE(exchange.open(AF_INET));
    EXPECT_TRUE(exchange.isOpen());
    EXPECT_NE(exchange.localPort(), 0);

    motd::MotdError error;
    EXPECT_FALSE(exchange.receive(std::chrono::milliseconds(10), &error).has_value());
    EXPECT_EQ(error.code, motd::MotdErrorCode::Timeout);
}

TEST(UdpExchangeTest, ReceiveWithoutSocketFails) {
    motd::net::UdpExchange exchange;
    motd::MotdError error;
    EXPECT_FALSE(exchange.receive(std::chrono::milliseconds(10), &error).has_value());
    EXPECT_EQ(error.code, motd::MotdErrorCode::ReceiveFailed);
}
