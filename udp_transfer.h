#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <system_error>

#include <asio.hpp>

#include "check.hpp"
#include "client_config.h"
#include "logger.h"
#include "message_validator.h"
#include "packet_builder.h"
#include "transfer_stats.h"
#include "udp_receive.h"

using asio::ip::udp;

// Client side of the unreliable path: one request, then count whatever payload segments
// arrive within the observation window. Loss, reordering and duplicates are measured, not
// treated as errors.
class UdpTransfer {
public:
    UdpTransfer(const udp::endpoint& server, uint64_t file_size,
                std::chrono::steady_clock::duration window  = client_config::RECEIVE_WINDOW,
                std::chrono::steady_clock::duration timeout = client_config::RECEIVE_TIMEOUT)
        : server_(server), file_size_(file_size), window_(window), timeout_(timeout) {}

    // Never throws; failures are reported through TransferResult::error
    TransferResult run(const std::atomic<bool>& stop) {
        TransferResult result{Transport::UDP};
        result.requested_bytes   = file_size_;
        result.expected_segments = transfer_stats::expected_segments(file_size_);

        auto start = std::chrono::steady_clock::now();
        try {
            asio::io_context io_context;
            udp::socket      socket(io_context, udp::endpoint(udp::v4(), 0));
            std::error_code  error_code;

            auto request = packet_builder::create_request_packet(file_size_);
            socket.send_to(asio::buffer(request), server_, 0, error_code);
            throw_if_err(error_code, "send request");
            Log::info("UDP request sent to {}:{} for file size {} bytes.",
                      server_.address().to_string(), server_.port(), file_size_);

            start = std::chrono::steady_clock::now();
            udp::endpoint sender;
            while (std::chrono::steady_clock::now() - start < window_ && !stop.load()) {
                std::size_t bytes = udp_receive::receive_from_for(
                    io_context, socket, asio::buffer(recv_buf_), sender, timeout_, error_code);
                if (error_code == asio::error::timed_out) {
                    break;  // server is done sending
                }
                throw_if_err(error_code, "receive");

                if (!message_validator::parse_payload(recv_buf_.data(), bytes)) {
                    continue;
                }
                ++result.received_segments;
                result.received_bytes += bytes - sizeof(PayloadHdr);
            }
            result.elapsed = std::chrono::steady_clock::now() - start;
            result.ok      = true;
        } catch (const std::exception& e) {
            result.elapsed = std::chrono::steady_clock::now() - start;
            result.error   = e.what();
        }
        return result;
    }

private:
    udp::endpoint                                           server_;
    uint64_t                                                file_size_;
    std::chrono::steady_clock::duration                     window_;
    std::chrono::steady_clock::duration                     timeout_;
    std::array<unsigned char, client_config::RECV_BUF_SIZE> recv_buf_{};
};
