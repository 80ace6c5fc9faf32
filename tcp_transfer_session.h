#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "logger.h"
#include "message_validator.h"
#include "packet_builder.h"
#include "server_config.h"
#include "transfer_stats.h"

using asio::ip::tcp;

// Server side of the reliable path for one accepted connection. Owns its socket; kept alive
// by the shared_ptr captured in each pending handler.
class TcpTransferSession : public std::enable_shared_from_this<TcpTransferSession> {
public:
    explicit TcpTransferSession(tcp::socket socket)
        : socket_(std::move(socket)),
          request_buf_(server_config::MAX_REQUEST_LINE),
          filler_(SEGMENT_SIZE, packet_builder::FILLER_BYTE) {
        std::error_code error_code;
        peer_ = socket_.remote_endpoint(error_code);
        if (error_code) {
            Log::debug("Peer address unavailable: {}", error_code.message());
        }
    }

    void start() {
        Log::info("Handling TCP connection from {}:{}", peer_.address().to_string(),
                  peer_.port());
        read_request();
    }

private:
    void read_request() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, request_buf_, '\n',
                               [this, self](std::error_code error_code, std::size_t) {
                                   on_request(error_code);
                               });
    }

    void on_request(std::error_code error_code) {
        if (error_code == asio::error::not_found) {
            // Line exceeded MAX_REQUEST_LINE without a terminator
            Log::warn("Oversized size request from {}:{}", peer_.address().to_string(),
                      peer_.port());
            close();
            return;
        }
        if (error_code) {
            Log::error("Error reading request from {}:{}: {}", peer_.address().to_string(),
                       peer_.port(), error_code.message());
            close();
            return;
        }

        std::istream stream(&request_buf_);
        std::string  line;
        std::getline(stream, line);

        auto file_size = message_validator::parse_size_request(line);
        if (!file_size) {
            Log::warn("Malformed size request from {}:{}: '{}'", peer_.address().to_string(),
                      peer_.port(), line);
            close();
            return;
        }

        requested_ = *file_size;
        Log::info("TCP client requested file of size: {} bytes", requested_);
        start_ = std::chrono::steady_clock::now();
        write_chunk();
    }

    // Whole filler buffers only, so the last write may overshoot requested_
    void write_chunk() {
        if (bytes_sent_ >= requested_) {
            finish();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(filler_),
                          [this, self](std::error_code error_code, std::size_t bytes) {
                              if (error_code) {
                                  Log::error("Error handling TCP client {}:{}: {}",
                                             peer_.address().to_string(), peer_.port(),
                                             error_code.message());
                                  close();
                                  return;
                              }
                              bytes_sent_ += bytes;
                              write_chunk();
                          });
    }

    void finish() {
        transfer_stats::seconds elapsed = std::chrono::steady_clock::now() - start_;
        Log::info("Sent {} bytes over TCP to {}:{} at {:.2f} bits/second", bytes_sent_,
                  peer_.address().to_string(), peer_.port(),
                  transfer_stats::bits_per_second(bytes_sent_, elapsed));
        close();
    }

    void close() {
        std::error_code error_code;
        socket_.shutdown(tcp::socket::shutdown_both, error_code);
        if (error_code && error_code != asio::error::not_connected) {
            Log::debug("TCP shutdown for {}:{}: {}", peer_.address().to_string(), peer_.port(),
                       error_code.message());
        }
        socket_.close(error_code);
        if (error_code) {
            Log::debug("TCP close for {}:{}: {}", peer_.address().to_string(), peer_.port(),
                       error_code.message());
        }
        Log::info("Connection with {}:{} closed", peer_.address().to_string(), peer_.port());
    }

    tcp::socket                           socket_;
    tcp::endpoint                         peer_;
    asio::streambuf                       request_buf_;
    std::vector<char>                     filler_;
    uint64_t                              requested_  = 0;
    uint64_t                              bytes_sent_ = 0;
    std::chrono::steady_clock::time_point start_;
};
