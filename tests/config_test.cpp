#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "client_config.h"
#include "server_config.h"

namespace {

// argv as the C runtime would hand it over
struct Args {
    explicit Args(std::vector<std::string> values) : storage(std::move(values)) {
        for (auto& value: storage) {
            pointers.push_back(value.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage.size());
    }

    char** argv() {
        return pointers.data();
    }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

}  // namespace

TEST(ServerConfigTest, DefaultsMatchWellKnownPorts) {
    Args args({"netspeed_server"});
    auto options = parse_server_args(args.argc(), args.argv());
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->tcp_port, 65432);
    EXPECT_EQ(options->udp_port, 14117);
    EXPECT_EQ(options->discovery_port, 14117);
    EXPECT_EQ(options->broadcast_address, "255.255.255.255");
    EXPECT_EQ(options->broadcast_interval, std::chrono::seconds(1));
    EXPECT_GE(options->threads, 1U);
}

TEST(ServerConfigTest, PositionalOverrides) {
    Args args({"netspeed_server", "5000", "6000", "192.168.1.255", "3"});
    auto options = parse_server_args(args.argc(), args.argv());
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->tcp_port, 5000);
    EXPECT_EQ(options->udp_port, 6000);
    EXPECT_EQ(options->broadcast_address, "192.168.1.255");
    EXPECT_EQ(options->threads, 3U);
}

TEST(ServerConfigTest, RejectsBadArguments) {
    Args bad_port({"netspeed_server", "70000"});
    EXPECT_FALSE(parse_server_args(bad_port.argc(), bad_port.argv()).has_value());

    Args bad_address({"netspeed_server", "1", "2", "not-an-address"});
    EXPECT_FALSE(parse_server_args(bad_address.argc(), bad_address.argv()).has_value());

    Args zero_threads({"netspeed_server", "1", "2", "127.0.0.1", "0"});
    EXPECT_FALSE(parse_server_args(zero_threads.argc(), zero_threads.argv()).has_value());
}

TEST(ClientConfigTest, NoArgumentsMeansInteractive) {
    Args args({"netspeed_client"});
    auto options = parse_client_args(args.argc(), args.argv());
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->interactive);
    EXPECT_EQ(options->discovery_port, 14117);
    EXPECT_EQ(options->discovery_timeout, std::chrono::steady_clock::duration::zero());
    EXPECT_EQ(options->receive_window, std::chrono::seconds(1));
    EXPECT_EQ(options->receive_timeout, std::chrono::seconds(1));
}

TEST(ClientConfigTest, TransferArguments) {
    Args args({"netspeed_client", "10240", "2", "3", "5"});
    auto options = parse_client_args(args.argc(), args.argv());
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->interactive);
    EXPECT_EQ(options->file_size, 10240U);
    EXPECT_EQ(options->tcp_connections, 2U);
    EXPECT_EQ(options->udp_connections, 3U);
    EXPECT_EQ(options->discovery_timeout, std::chrono::seconds(5));
}

TEST(ClientConfigTest, RejectsIncompleteOrMalformedArguments) {
    Args partial({"netspeed_client", "10240", "2"});
    EXPECT_FALSE(parse_client_args(partial.argc(), partial.argv()).has_value());

    Args negative({"netspeed_client", "-1", "1", "1"});
    EXPECT_FALSE(parse_client_args(negative.argc(), negative.argv()).has_value());

    Args words({"netspeed_client", "big", "1", "1"});
    EXPECT_FALSE(parse_client_args(words.argc(), words.argv()).has_value());
}
