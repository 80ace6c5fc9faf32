#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "server_config.h"
#include "speedtest_server.h"

using namespace std::chrono_literals;

// Ask the kernel for a UDP port that is free right now
inline uint16_t free_udp_port() {
    asio::io_context      io_context;
    asio::ip::udp::socket socket(io_context,
                                 asio::ip::udp::endpoint(asio::ip::address_v4::loopback(), 0));
    return socket.local_endpoint().port();
}

// Loopback-only server options: ephemeral transfer ports, fast offers
inline ServerOptions loopback_options(uint16_t discovery_port) {
    ServerOptions options;
    options.tcp_port           = 0;
    options.udp_port           = 0;
    options.discovery_port     = discovery_port;
    options.broadcast_address  = "127.0.0.1";
    options.broadcast_interval = 50ms;
    options.threads            = 2;
    return options;
}

// A real SpeedTestServer running on its own threads for the lifetime of the object
class LoopbackServer {
public:
    explicit LoopbackServer(uint16_t discovery_port = free_udp_port()) {
        auto options = loopback_options(discovery_port);
        server_.emplace(io_context_, options);
        server_->start();
        for (unsigned i = 0; i < options.threads; ++i) {
            threads_.emplace_back([this]() { io_context_.run(); });
        }
    }

    ~LoopbackServer() {
        io_context_.stop();
        for (auto& thread: threads_) {
            thread.join();
        }
    }

    LoopbackServer(const LoopbackServer&)            = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    uint16_t tcp_port() const {
        return server_->tcp_port();
    }

    uint16_t udp_port() const {
        return server_->udp_port();
    }

private:
    asio::io_context               io_context_;
    std::optional<SpeedTestServer> server_;
    std::vector<std::thread>       threads_;
};
