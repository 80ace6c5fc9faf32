#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

#include <asio.hpp>

#include "logger.h"
#include "packet_builder.h"
#include "transfer_stats.h"

using asio::ip::udp;

// Server side of the unreliable path for one request: fire expected_segments(file_size)
// payload datagrams at the client back to back from a private socket. No pacing, no acks,
// no retransmission.
class UdpTransferSession : public std::enable_shared_from_this<UdpTransferSession> {
public:
    UdpTransferSession(asio::io_context& io_context, const udp::endpoint& client,
                       uint64_t file_size)
        : socket_(io_context, udp::endpoint(udp::v4(), 0)),
          client_(client),
          file_size_(file_size),
          total_segments_(transfer_stats::expected_segments(file_size)),
          packet_(packet_builder::create_payload_packet(total_segments_, 0)) {}

    void start() {
        Log::info("Handling UDP client from {}:{} requesting file of size: {}",
                  client_.address().to_string(), client_.port(), file_size_);
        start_ = std::chrono::steady_clock::now();
        send_next();
    }

private:
    // One datagram in flight at a time, so packet_ can be rewritten between sends
    void send_next() {
        if (next_index_ >= total_segments_) {
            finish();
            return;
        }
        packet_builder::write_payload_header(packet_->data(), total_segments_, next_index_);

        auto self = shared_from_this();
        socket_.async_send_to(asio::buffer(*packet_), client_,
                              [this, self](std::error_code error_code, std::size_t bytes) {
                                  if (error_code) {
                                      Log::error("Error handling UDP client {}:{}: {}",
                                                 client_.address().to_string(), client_.port(),
                                                 error_code.message());
                                      return;
                                  }
                                  bytes_sent_ += bytes;
                                  ++next_index_;
                                  Log::debug("Sent segment {}/{} to {}:{}", next_index_,
                                             total_segments_, client_.address().to_string(),
                                             client_.port());
                                  send_next();
                              });
    }

    // Rate counts bytes handed to the transport, not bytes the client got
    void finish() {
        transfer_stats::seconds elapsed = std::chrono::steady_clock::now() - start_;
        Log::info("Sent {} bytes over UDP to {}:{} at {:.2f} bits/second", bytes_sent_,
                  client_.address().to_string(), client_.port(),
                  transfer_stats::bits_per_second(bytes_sent_, elapsed));
    }

    udp::socket                                 socket_;
    udp::endpoint                               client_;
    uint64_t                                    file_size_;
    uint64_t                                    total_segments_;
    std::shared_ptr<std::vector<unsigned char>> packet_;
    uint64_t                                    next_index_ = 0;
    uint64_t                                    bytes_sent_ = 0;
    std::chrono::steady_clock::time_point       start_;
};
