#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include <asio/ip/address_v4.hpp>

#include "message_validator.h"
#include "protocol.h"

using namespace std::chrono_literals;

// Server configuration constants

namespace server_config {
constexpr auto   BROADCAST_INTERVAL = 1s;
constexpr size_t RECV_BUF_SIZE      = 1024;
constexpr size_t MAX_REQUEST_LINE   = 64;  // longest accepted "<decimal>\n" on the TCP path
constexpr auto   BROADCAST_ADDRESS  = "255.255.255.255";

}  // namespace server_config

struct ServerOptions {
    uint16_t tcp_port       = TRANSFER_PORT;
    uint16_t udp_port       = DISCOVERY_PORT;  // requests share the discovery port by default
    uint16_t discovery_port = DISCOVERY_PORT;

    std::string                         broadcast_address  = server_config::BROADCAST_ADDRESS;
    std::chrono::steady_clock::duration broadcast_interval = server_config::BROADCAST_INTERVAL;

    unsigned threads = std::max(1U, std::thread::hardware_concurrency());
};

// netspeed_server [tcp_port [udp_port [broadcast_address [threads]]]]
inline std::optional<ServerOptions> parse_server_args(int argc, char* argv[]) {
    ServerOptions options;
    if (argc > 5) {
        return std::nullopt;
    }
    if (argc >= 2) {
        auto port = message_validator::parse_unsigned<uint16_t>(argv[1]);
        if (!port) {
            return std::nullopt;
        }
        options.tcp_port = *port;
    }
    if (argc >= 3) {
        auto port = message_validator::parse_unsigned<uint16_t>(argv[2]);
        if (!port) {
            return std::nullopt;
        }
        options.udp_port = *port;
    }
    if (argc >= 4) {
        std::error_code error_code;
        auto            address = asio::ip::make_address_v4(argv[3], error_code);
        if (error_code) {
            return std::nullopt;
        }
        options.broadcast_address = address.to_string();
    }
    if (argc >= 5) {
        auto threads = message_validator::parse_unsigned<unsigned>(argv[4]);
        if (!threads || *threads == 0) {
            return std::nullopt;
        }
        options.threads = *threads;
    }
    return options;
}
