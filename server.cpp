#include <csignal>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/common.h>

#include "logger.h"
#include "server_config.h"
#include "speedtest_server.h"

int main(int argc, char* argv[]) {
    auto options = parse_server_args(argc, argv);
    if (!options) {
        std::cerr << "usage: " << argv[0]
                  << " [tcp_port [udp_port [broadcast_address [threads]]]]\n";
        return 1;
    }

    try {
        auto& log = Logger::instance();
        log.init(true, false, "", spdlog::level::info);

        asio::io_context io_context;

        SpeedTestServer srv(io_context, *options);
        srv.start();

        // Ctrl+C / SIGTERM end every loop and session at once
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&io_context](std::error_code error_code, int signal_number) {
            if (!error_code) {
                Log::info("Signal {} received, shutting down", signal_number);
            }
            io_context.stop();
        });

        log.info("Server listening on all interfaces with {} threads", options->threads);

        // A handler that escapes with an exception takes the whole server down
        auto run = [&io_context]() {
            try {
                io_context.run();
            } catch (const std::exception& e) {
                Log::error("ERR: {}", e.what());
                io_context.stop();
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(options->threads - 1);
        for (unsigned i = 1; i < options->threads; ++i) {
            pool.emplace_back(run);
        }
        run();

        for (auto& thread: pool) {
            thread.join();
        }
        log.flush();
    } catch (std::exception& e) {
        Log::error("ERR: {}", e.what());
        Logger::instance().flush();
        return 1;
    }

    return 0;
}
