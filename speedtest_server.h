#pragma once

#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include <system_error>
#include <utility>

#include <asio.hpp>

#include "logger.h"
#include "message_validator.h"
#include "offer_broadcaster.h"
#include "server_config.h"
#include "tcp_transfer_session.h"
#include "udp_transfer_session.h"

using asio::ip::tcp;
using asio::ip::udp;

// Runs the three server activities on one io_context: offer broadcast, TCP accept and UDP
// request intake. Every accepted connection or request becomes an independent session that
// owns its own socket. Call io_context.run() from as many threads as wanted.
class SpeedTestServer {
public:
    SpeedTestServer(asio::io_context& io_context, const ServerOptions& options)
        : io_context_(io_context),
          acceptor_(io_context, tcp::endpoint(tcp::v4(), options.tcp_port)),
          request_socket_(make_request_socket(io_context, options.udp_port)),
          broadcaster_(io_context,
                       udp::endpoint(asio::ip::make_address_v4(options.broadcast_address),
                                     options.discovery_port),
                       request_socket_.local_endpoint().port(),
                       acceptor_.local_endpoint().port(), options.broadcast_interval) {}

    void start() {
        broadcaster_.start();
        do_accept();
        do_receive();
        Log::info("Server started, TCP port {}, UDP port {}", tcp_port(), udp_port());
    }

    uint16_t tcp_port() const {
        return acceptor_.local_endpoint().port();
    }

    uint16_t udp_port() const {
        return request_socket_.local_endpoint().port();
    }

private:
    // Shares the discovery port with local listeners, hence SO_REUSEADDR
    static udp::socket make_request_socket(asio::io_context& io_context, uint16_t port) {
        udp::socket socket(io_context);
        socket.open(udp::v4());
        socket.set_option(asio::socket_base::reuse_address(true));
        socket.bind(udp::endpoint(udp::v4(), port));
        return socket;
    }

    void do_accept() {
        acceptor_.async_accept([this](std::error_code error_code, tcp::socket socket) {
            if (error_code == asio::error::operation_aborted) {
                return;
            }
            if (!error_code) {
                std::make_shared<TcpTransferSession>(std::move(socket))->start();
            } else {
                Log::error("Error accepting TCP connection: {}", error_code.message());
            }

            // Continue accepting new connections
            do_accept();
        });
    }

    void do_receive() {
        request_socket_.async_receive_from(
            asio::buffer(recv_buf_), remote_endpoint_,
            [this](std::error_code error_code, std::size_t bytes) { on_receive(error_code, bytes); });
    }

    void on_receive(std::error_code error_code, std::size_t bytes) {
        if (error_code == asio::error::operation_aborted) {
            return;
        }
        if (error_code) {
            Log::error("Error in UDP server: {}", error_code.message());
            do_receive();  // keep listening
            return;
        }

        // Our own offers and unrelated traffic land here too; drop silently
        auto file_size = message_validator::parse_request(recv_buf_.data(), bytes);
        if (file_size) {
            try {
                std::make_shared<UdpTransferSession>(io_context_, remote_endpoint_, *file_size)
                    ->start();
            } catch (const std::exception& e) {
                Log::error("Error handling UDP client {}:{}: {}",
                           remote_endpoint_.address().to_string(), remote_endpoint_.port(),
                           e.what());
            }
        }

        do_receive();  // start next receive immediately
    }

    asio::io_context& io_context_;
    tcp::acceptor     acceptor_;
    udp::socket       request_socket_;
    OfferBroadcaster  broadcaster_;

    std::array<unsigned char, server_config::RECV_BUF_SIZE> recv_buf_{};
    udp::endpoint                                           remote_endpoint_;
};
