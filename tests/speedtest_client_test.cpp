#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <asio.hpp>
#include <gtest/gtest.h>

#include "speedtest_client.h"
#include "test_support.h"

namespace {

ClientOptions loopback_client(uint16_t discovery_port, uint64_t file_size, unsigned tcp_count,
                              unsigned udp_count) {
    ClientOptions options;
    options.file_size         = file_size;
    options.tcp_connections   = tcp_count;
    options.udp_connections   = udp_count;
    options.discovery_port    = discovery_port;
    options.discovery_timeout = 3s;
    options.receive_timeout   = 300ms;
    return options;
}

ServerOffer offer_for(const LoopbackServer& server) {
    return ServerOffer{asio::ip::address_v4::loopback(), server.udp_port(), server.tcp_port()};
}

}  // namespace

TEST(SpeedTestClientTest, CycleYieldsOneResultPerWorker) {
    LoopbackServer    server;
    std::atomic<bool> stop{false};
    SpeedTestClient   client(loopback_client(0, 4096, 2, 3), stop);

    auto results = client.run_cycle(offer_for(server));
    ASSERT_EQ(results.size(), 5U);
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_TRUE(results[i].ok) << results[i].error;
        EXPECT_EQ(results[i].transport, i < 2 ? Transport::TCP : Transport::UDP);
        EXPECT_EQ(results[i].requested_bytes, 4096U);
    }
}

TEST(SpeedTestClientTest, WorkersThatCannotStartAreReportedAsFailed) {
    LoopbackServer    server;
    std::atomic<bool> stop{false};

    // The OS runs out of threads after the second launch
    int  launched = 0;
    auto launcher = [&launched](std::function<void()> work) {
        if (++launched > 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread");
        }
        return std::thread(std::move(work));
    };
    SpeedTestClient client(loopback_client(0, 4096, 2, 2), stop, launcher);

    auto results = client.run_cycle(offer_for(server));
    ASSERT_EQ(results.size(), 4U);

    for (std::size_t i = 0; i < 2; ++i) {
        EXPECT_TRUE(results[i].ok) << results[i].error;
        EXPECT_GE(results[i].received_bytes, 4096U);
    }
    for (std::size_t i = 2; i < 4; ++i) {
        EXPECT_FALSE(results[i].ok);
        EXPECT_EQ(results[i].transport, Transport::UDP);
        EXPECT_EQ(results[i].requested_bytes, 4096U);
        EXPECT_NE(results[i].error.find("could not start worker"), std::string::npos);
    }
}

TEST(SpeedTestClientTest, NoWorkersRequested) {
    LoopbackServer    server;
    std::atomic<bool> stop{false};
    SpeedTestClient   client(loopback_client(0, 4096, 0, 0), stop);

    EXPECT_TRUE(client.run_cycle(offer_for(server)).empty());
}

TEST(SpeedTestClientTest, TenKilobytesOverBothTransports) {
    uint16_t          discovery_port = free_udp_port();
    LoopbackServer    server(discovery_port);
    std::atomic<bool> stop{false};
    SpeedTestClient   client(loopback_client(discovery_port, 10240, 1, 1), stop);

    auto offer = client.discover();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->tcp_port, server.tcp_port());
    EXPECT_EQ(offer->udp_port, server.udp_port());

    auto results = client.run_cycle(*offer);
    ASSERT_EQ(results.size(), 2U);

    const auto& tcp_result = results[0];
    ASSERT_TRUE(tcp_result.ok) << tcp_result.error;
    EXPECT_GE(tcp_result.received_bytes, 10240U);

    const auto& udp_result = results[1];
    ASSERT_TRUE(udp_result.ok) << udp_result.error;
    EXPECT_EQ(udp_result.expected_segments, 10U);
    EXPECT_LE(udp_result.success_rate(), 100.0);
    EXPECT_GE(udp_result.bits_per_second(), 0.0);
}

TEST(SpeedTestClientTest, ZeroSizeOverBothTransports) {
    LoopbackServer    server;
    std::atomic<bool> stop{false};
    SpeedTestClient   client(loopback_client(0, 0, 1, 1), stop);

    auto results = client.run_cycle(offer_for(server));
    ASSERT_EQ(results.size(), 2U);

    ASSERT_TRUE(results[0].ok) << results[0].error;
    EXPECT_EQ(results[0].received_bytes, 0U);

    ASSERT_TRUE(results[1].ok) << results[1].error;
    EXPECT_EQ(results[1].expected_segments, 0U);
    EXPECT_DOUBLE_EQ(results[1].success_rate(), 0.0);
}

TEST(SpeedTestClientTest, DiscoveryWorksAgainAfterACycle) {
    uint16_t          discovery_port = free_udp_port();
    LoopbackServer    server(discovery_port);
    std::atomic<bool> stop{false};
    SpeedTestClient   client(loopback_client(discovery_port, 2048, 1, 1), stop);

    for (int cycle = 0; cycle < 2; ++cycle) {
        auto offer = client.discover();
        ASSERT_TRUE(offer.has_value()) << "cycle " << cycle;
        auto results = client.run_cycle(*offer);
        ASSERT_EQ(results.size(), 2U);
        EXPECT_TRUE(results[0].ok) << results[0].error;
        EXPECT_TRUE(results[1].ok) << results[1].error;
    }
}

TEST(SpeedTestClientTest, RunGivesUpWhenNoServerAnswers) {
    std::atomic<bool> stop{false};
    auto              options = loopback_client(free_udp_port(), 1024, 1, 1);
    options.discovery_timeout = 200ms;
    SpeedTestClient client(options, stop);

    auto start = std::chrono::steady_clock::now();
    client.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(SpeedTestClientTest, RunReturnsOnceStopped) {
    std::atomic<bool> stop{true};
    SpeedTestClient   client(loopback_client(free_udp_port(), 1024, 1, 1), stop);
    client.run();
    SUCCEED();
}
