#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "message_validator.h"
#include "protocol.h"

using namespace std::chrono_literals;

// Client configuration constants

namespace client_config {
constexpr auto   RECEIVE_WINDOW          = 1s;  // observation window of one UDP transfer
constexpr auto   RECEIVE_TIMEOUT         = 1s;  // per-datagram wait inside the window
constexpr auto   DISCOVERY_POLL_INTERVAL = 250ms;
constexpr size_t RECV_BUF_SIZE           = 2048;

}  // namespace client_config

struct ClientOptions {
    uint64_t file_size       = 0;
    unsigned tcp_connections = 0;
    unsigned udp_connections = 0;
    uint16_t discovery_port  = DISCOVERY_PORT;

    // Zero waits for an offer forever
    std::chrono::steady_clock::duration discovery_timeout = std::chrono::steady_clock::duration::zero();
    std::chrono::steady_clock::duration receive_window    = client_config::RECEIVE_WINDOW;
    std::chrono::steady_clock::duration receive_timeout   = client_config::RECEIVE_TIMEOUT;

    // Transfer counts still have to be asked for on stdin
    bool interactive = false;
};

// netspeed_client [file_size tcp_connections udp_connections [discovery_timeout_seconds]]
inline std::optional<ClientOptions> parse_client_args(int argc, char* argv[]) {
    ClientOptions options;
    if (argc == 1) {
        options.interactive = true;
        return options;
    }
    if (argc != 4 && argc != 5) {
        return std::nullopt;
    }

    auto file_size = message_validator::parse_unsigned<uint64_t>(argv[1]);
    auto tcp_count = message_validator::parse_unsigned<unsigned>(argv[2]);
    auto udp_count = message_validator::parse_unsigned<unsigned>(argv[3]);
    if (!file_size || !tcp_count || !udp_count) {
        return std::nullopt;
    }
    options.file_size       = *file_size;
    options.tcp_connections = *tcp_count;
    options.udp_connections = *udp_count;

    if (argc == 5) {
        auto timeout = message_validator::parse_unsigned<unsigned>(argv[4]);
        if (!timeout) {
            return std::nullopt;
        }
        options.discovery_timeout = std::chrono::seconds(*timeout);
    }
    return options;
}
