#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <system_error>

#include <asio.hpp>

#include "logger.h"
#include "packet_builder.h"
#include "periodic_timer.h"
#include "protocol.h"

using asio::ip::udp;

// Announces the server's transfer ports once per interval until stopped
class OfferBroadcaster {
public:
    OfferBroadcaster(asio::io_context& io_context, const udp::endpoint& target, uint16_t udp_port,
                     uint16_t tcp_port, std::chrono::steady_clock::duration interval)
        : socket_(io_context, udp::v4()),
          target_(target),
          offer_(packet_builder::create_offer_packet(udp_port, tcp_port)),
          timer_(io_context, interval, [this]() { send_offer(); }) {
        socket_.set_option(asio::socket_base::broadcast(true));
        Log::info("Broadcasting offers to {}:{} every {}ms (UDP port {}, TCP port {})",
                  target_.address().to_string(), target_.port(),
                  std::chrono::duration_cast<std::chrono::milliseconds>(interval).count(),
                  udp_port, tcp_port);
    }

    // First offer goes out immediately
    void start() {
        timer_.start(true);
    }

    void stop() {
        timer_.stop();
    }

    uint64_t offers_sent() const {
        return offers_sent_.load();
    }

private:
    void send_offer() {
        // offer_ is a member, so it outlives the async send
        socket_.async_send_to(asio::buffer(offer_), target_,
                              [this](std::error_code error_code, std::size_t) {
                                  if (error_code) {
                                      Log::error("Offer broadcast failed: {}", error_code.message());
                                      return;
                                  }
                                  ++offers_sent_;
                                  Log::debug("Offer message sent via broadcast");
                              });
    }

    udp::socket                                 socket_;
    udp::endpoint                               target_;
    std::array<unsigned char, sizeof(OfferHdr)> offer_;
    PeriodicTimer                               timer_;
    std::atomic<uint64_t>                       offers_sent_{0};
};
