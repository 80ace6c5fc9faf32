#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "client_config.h"
#include "logger.h"
#include "offer_listener.h"
#include "tcp_transfer.h"
#include "transfer_stats.h"
#include "udp_transfer.h"

// Discover -> transfer -> repeat. Each cycle starts one thread per requested transfer; the
// threads share nothing but the read-only offer and options, and each fills only its own
// result slot.
class SpeedTestClient {
public:
    // Starts one worker thread; may throw std::system_error when the OS refuses
    using Launcher = std::function<std::thread(std::function<void()>)>;

    SpeedTestClient(const ClientOptions& options, const std::atomic<bool>& stop,
                    Launcher launcher = default_launcher)
        : options_(options), stop_(stop), launcher_(std::move(launcher)) {}

    // A fresh socket per call, so the discovery port is only held while listening
    std::optional<ServerOffer> discover() {
        Log::info("Client started, listening for offer requests...");
        OfferListener listener(options_.discovery_port);
        return listener.wait_for_offer(options_.discovery_timeout, stop_);
    }

    // Results are ordered: all TCP transfers first, then all UDP transfers
    std::vector<TransferResult> run_cycle(const ServerOffer& offer) {
        const std::size_t           tcp_count = options_.tcp_connections;
        const std::size_t           udp_count = options_.udp_connections;
        std::vector<TransferResult> results(tcp_count + udp_count);
        std::vector<std::thread>    workers;
        workers.reserve(tcp_count + udp_count);

        const tcp::endpoint tcp_server(offer.address, offer.tcp_port);
        const udp::endpoint udp_server(offer.address, offer.udp_port);

        for (std::size_t i = 0; i < tcp_count; ++i) {
            launch(workers, results[i], Transport::TCP, i + 1,
                   [this, &results, tcp_server, i]() {
                       results[i] = TcpTransfer(tcp_server, options_.file_size).run();
                       report(results[i], i + 1);
                   });
        }

        for (std::size_t i = 0; i < udp_count; ++i) {
            launch(workers, results[tcp_count + i], Transport::UDP, i + 1,
                   [this, &results, udp_server, tcp_count, i]() {
                       UdpTransfer transfer(udp_server, options_.file_size,
                                            options_.receive_window, options_.receive_timeout);
                       results[tcp_count + i] = transfer.run(stop_);
                       report(results[tcp_count + i], i + 1);
                   });
        }

        // Wait for all threads to complete
        for (auto& worker: workers) {
            worker.join();
        }
        Log::info("All transfers complete, listening to offer requests...");
        return results;
    }

    // Runs until stop is set or discovery gives up
    void run() {
        while (!stop_.load()) {
            auto offer = discover();
            if (!offer) {
                if (!stop_.load()) {
                    Log::warn("No server offer received within {}s",
                              std::chrono::duration_cast<std::chrono::seconds>(
                                  options_.discovery_timeout)
                                  .count());
                }
                return;
            }
            run_cycle(*offer);
        }
    }

    static void report(const TransferResult& result, std::size_t number) {
        const char* name = transport_name(result.transport);
        if (!result.ok) {
            Log::error("Error during {} transfer #{}: {}", name, number, result.error);
            return;
        }
        if (result.transport == Transport::TCP) {
            Log::info("TCP transfer #{} finished, total time: {:.2f} seconds, speed: {:.2f} "
                      "bits/second",
                      number, result.elapsed.count(), result.bits_per_second());
        } else {
            Log::info("UDP transfer #{} finished, total time: {:.2f} seconds, speed: {:.2f} "
                      "bits/second, percentage of packets received successfully: {:.2f}%",
                      number, result.elapsed.count(), result.bits_per_second(),
                      result.success_rate());
        }
    }

private:
    static std::thread default_launcher(std::function<void()> work) {
        return std::thread(std::move(work));
    }

    // A worker that cannot be started is reported as failed; the others keep running
    void launch(std::vector<std::thread>& workers, TransferResult& slot, Transport transport,
                std::size_t number, std::function<void()> work) {
        std::thread worker;
        try {
            worker = launcher_(std::move(work));
        } catch (const std::exception& e) {
            slot.transport       = transport;
            slot.requested_bytes = options_.file_size;
            slot.error           = std::string("could not start worker: ") + e.what();
            report(slot, number);
            return;
        }
        workers.push_back(std::move(worker));  // capacity reserved, cannot throw
        Log::info("{} transfer #{} started", transport_name(transport), number);
    }

    ClientOptions            options_;
    const std::atomic<bool>& stop_;
    Launcher                 launcher_;
};
