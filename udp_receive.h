#pragma once

#include <chrono>
#include <cstddef>
#include <system_error>

#include <asio.hpp>

namespace udp_receive {

// Blocking receive_from with a deadline. The socket must belong to io_context and nothing else
// may be pending on it. On expiry error_code is asio::error::timed_out.
template <typename MutableBuffer>
std::size_t receive_from_for(asio::io_context& io_context, asio::ip::udp::socket& socket,
                             const MutableBuffer& buffer, asio::ip::udp::endpoint& sender,
                             std::chrono::steady_clock::duration timeout,
                             std::error_code&                    error_code) {
    std::size_t bytes = 0;
    error_code        = asio::error::would_block;
    socket.async_receive_from(buffer, sender, [&](std::error_code ec, std::size_t received) {
        error_code = ec;
        bytes      = received;
    });

    io_context.restart();
    io_context.run_for(timeout);

    // Still pending: cancel and let the handler run with operation_aborted
    if (!io_context.stopped()) {
        socket.cancel();
        io_context.run();
    }

    if (error_code == asio::error::operation_aborted) {
        error_code = asio::error::timed_out;
    }
    return bytes;
}

}  // namespace udp_receive
