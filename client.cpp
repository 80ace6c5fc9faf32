#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include <asio.hpp>
#include <spdlog/common.h>

#include "client_config.h"
#include "logger.h"
#include "message_validator.h"
#include "speedtest_client.h"

namespace {

template <typename T>
std::optional<T> prompt(const char* question) {
    std::cout << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return message_validator::parse_unsigned<T>(line);
}

// Fill the transfer parameters from stdin when they were not given on the command line
bool prompt_transfer_options(ClientOptions& options) {
    auto file_size = prompt<uint64_t>("Enter file size in bytes: ");
    if (!file_size) {
        return false;
    }
    auto tcp_count = prompt<unsigned>("Enter number of TCP connections: ");
    if (!tcp_count) {
        return false;
    }
    auto udp_count = prompt<unsigned>("Enter number of UDP connections: ");
    if (!udp_count) {
        return false;
    }

    options.file_size       = *file_size;
    options.tcp_connections = *tcp_count;
    options.udp_connections = *udp_count;
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parse_client_args(argc, argv);
    if (options && options->interactive && !prompt_transfer_options(*options)) {
        options.reset();
    }
    if (!options) {
        std::cerr << "usage: " << argv[0]
                  << " [file_size tcp_connections udp_connections [discovery_timeout_seconds]]\n";
        return 1;
    }

    auto& log = Logger::instance();
    log.init(true, false, "", spdlog::level::info);

    // Signals are watched on their own io_context; workers poll the flag
    std::atomic<bool> stop{false};
    asio::io_context  signal_context;
    asio::signal_set  signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&stop](std::error_code error_code, int signal_number) {
        if (error_code) {
            return;
        }
        Log::info("Signal {} received, finishing current cycle", signal_number);
        stop.store(true);
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    int status = 0;
    try {
        SpeedTestClient client(*options, stop);
        client.run();
    } catch (std::exception& e) {
        Log::error("ERR: {}", e.what());
        status = 1;
    }

    signal_context.stop();
    signal_thread.join();
    log.flush();
    return status;
}
