#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <system_error>

#include <asio.hpp>

#include "client_config.h"
#include "logger.h"
#include "message_validator.h"
#include "udp_receive.h"

using asio::ip::udp;

// Where to run transfers, as learned from an offer
struct ServerOffer {
    asio::ip::address address;
    uint16_t          udp_port;
    uint16_t          tcp_port;
};

// Waits on the discovery port for a server offer. Several listeners (and the server's own
// request socket) may share the port thanks to SO_REUSEADDR.
class OfferListener {
public:
    explicit OfferListener(uint16_t port) : socket_(io_context_) {
        socket_.open(udp::v4());
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(udp::endpoint(udp::v4(), port));
    }

    uint16_t local_port() const {
        return socket_.local_endpoint().port();
    }

    // Blocks until a valid offer arrives, timeout expires (zero means never) or stop is set.
    // Anything that is not an offer is skipped.
    std::optional<ServerOffer> wait_for_offer(std::chrono::steady_clock::duration timeout,
                                              const std::atomic<bool>&            stop) {
        using clock         = std::chrono::steady_clock;
        const bool forever  = timeout <= clock::duration::zero();
        const auto deadline = clock::now() + timeout;

        while (!stop.load()) {
            auto slice = std::chrono::duration_cast<clock::duration>(
                client_config::DISCOVERY_POLL_INTERVAL);
            if (!forever) {
                auto remaining = deadline - clock::now();
                if (remaining <= clock::duration::zero()) {
                    break;
                }
                slice = std::min(slice, remaining);
            }

            std::error_code error_code;
            udp::endpoint   sender;
            std::size_t     bytes = udp_receive::receive_from_for(
                io_context_, socket_, asio::buffer(recv_buf_), sender, slice, error_code);

            if (error_code == asio::error::timed_out) {
                continue;
            }
            if (error_code) {
                Log::error("Error receiving offer: {}", error_code.message());
                continue;
            }

            auto offer = message_validator::parse_offer(recv_buf_.data(), bytes);
            if (!offer) {
                continue;
            }

            Log::info("Received offer from {} on TCP port {}, UDP port {}",
                      sender.address().to_string(), offer->tcp_port, offer->udp_port);
            return ServerOffer{sender.address(), offer->udp_port, offer->tcp_port};
        }
        return std::nullopt;
    }

private:
    asio::io_context                                        io_context_;
    udp::socket                                             socket_;
    std::array<unsigned char, client_config::RECV_BUF_SIZE> recv_buf_{};
};
