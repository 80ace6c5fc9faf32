#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

#include "protocol.h"

enum class Transport : uint8_t {
    TCP,
    UDP,
};

inline const char* transport_name(Transport transport) {
    return transport == Transport::TCP ? "TCP" : "UDP";
}

namespace transfer_stats {

using seconds = std::chrono::duration<double>;

// Whole segments only: a remainder shorter than SEGMENT_SIZE is never sent
constexpr uint64_t expected_segments(uint64_t file_size) {
    return file_size / SEGMENT_SIZE;
}

// 0 when no time has elapsed rather than infinity
inline double bits_per_second(uint64_t bytes, seconds elapsed) {
    if (elapsed.count() <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) * 8.0 / elapsed.count();
}

// Percentage of expected segments that arrived. Duplicates count per arrival, so the
// ratio is capped at 100.
inline double success_rate(uint64_t received_segments, uint64_t expected) {
    if (expected == 0) {
        return 0.0;
    }
    double rate = static_cast<double>(received_segments) * 100.0 / static_cast<double>(expected);
    return std::min(rate, 100.0);
}

}  // namespace transfer_stats

// Outcome of one client worker
struct TransferResult {
    Transport               transport         = Transport::TCP;
    uint64_t                requested_bytes   = 0;
    uint64_t                received_bytes    = 0;
    transfer_stats::seconds elapsed           = transfer_stats::seconds::zero();
    uint64_t                expected_segments = 0;  // UDP only
    uint64_t                received_segments = 0;  // UDP only, arrivals not distinct indices
    bool                    ok                = false;
    std::string             error;

    double bits_per_second() const {
        return transfer_stats::bits_per_second(received_bytes, elapsed);
    }

    double success_rate() const {
        return transfer_stats::success_rate(received_segments, expected_segments);
    }
};
