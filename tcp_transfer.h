#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <system_error>

#include <asio.hpp>

#include "check.hpp"
#include "logger.h"
#include "packet_builder.h"
#include "protocol.h"
#include "transfer_stats.h"

using asio::ip::tcp;

// Client side of the reliable path: one connection, one request, read until file_size bytes
class TcpTransfer {
public:
    TcpTransfer(const tcp::endpoint& server, uint64_t file_size)
        : server_(server), file_size_(file_size) {}

    // Never throws; failures are reported through TransferResult::error
    TransferResult run() {
        TransferResult result{Transport::TCP};
        result.requested_bytes = file_size_;

        // Timing includes connection setup
        auto start = std::chrono::steady_clock::now();
        try {
            asio::io_context io_context;
            tcp::socket      socket(io_context);
            std::error_code  error_code;

            socket.connect(server_, error_code);
            throw_if_err(error_code, "connect");

            asio::write(socket, asio::buffer(packet_builder::create_size_request(file_size_)),
                        error_code);
            throw_if_err(error_code, "send request");

            // The server may overshoot on its last write, so count everything read
            std::array<char, SEGMENT_SIZE> buf;
            while (result.received_bytes < file_size_) {
                std::size_t bytes = socket.read_some(asio::buffer(buf), error_code);
                throw_if_err(error_code, "receive");
                result.received_bytes += bytes;
            }
            result.elapsed = std::chrono::steady_clock::now() - start;
            result.ok      = true;

            socket.shutdown(tcp::socket::shutdown_both, error_code);
            if (error_code) {
                Log::debug("TCP shutdown: {}", error_code.message());
            }
        } catch (const std::exception& e) {
            result.elapsed = std::chrono::steady_clock::now() - start;
            result.error   = e.what();
        }
        return result;
    }

private:
    tcp::endpoint server_;
    uint64_t      file_size_;
};
