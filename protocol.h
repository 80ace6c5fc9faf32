#pragma once

#include <arpa/inet.h>

#include <bit>
#include <cstddef>
#include <cstdint>

// Shared by every message so foreign traffic on the discovery and request ports can be told apart
constexpr uint32_t PROTOCOL_MAGIC = 0xABCDDCBA;

// Well-known ports
constexpr uint16_t DISCOVERY_PORT = 14117;
constexpr uint16_t TRANSFER_PORT  = 65432;

// Every unreliable payload datagram is exactly this long
constexpr size_t SEGMENT_SIZE = 1024;

enum class MsgType : uint8_t {
    OFFER   = 0x2,
    REQUEST = 0x3,
    PAYLOAD = 0x4,
};

// All multi-byte fields travel in network byte order
#pragma pack(push, 1)

struct MsgHdr {
    uint32_t magic;
    MsgType  type;
};

struct OfferHdr : MsgHdr {
    uint16_t udp_port;
    uint16_t tcp_port;
};

struct RequestHdr : MsgHdr {
    uint64_t file_size;
};

struct PayloadHdr : MsgHdr {
    uint64_t total_segments;
    uint64_t segment_index;
};

#pragma pack(pop)

static_assert(sizeof(OfferHdr) == 9, "offer must be 9 bytes on the wire");
static_assert(sizeof(RequestHdr) == 13, "request must be 13 bytes on the wire");
static_assert(sizeof(PayloadHdr) == 21, "payload header must be 21 bytes on the wire");
static_assert(SEGMENT_SIZE > sizeof(PayloadHdr));

// Decoded views of the messages above, in host byte order
struct Offer {
    uint16_t udp_port;
    uint16_t tcp_port;
};

struct PayloadInfo {
    uint64_t total_segments;
    uint64_t segment_index;
};

// Host <-> network conversion. 16 and 32 bit fields go through the socket API; the 64 bit
// sizes and segment counters are swapped by hand.
inline uint16_t to_network(uint16_t value) {
    return htons(value);
}

inline uint32_t to_network(uint32_t value) {
    return htonl(value);
}

inline uint64_t to_network(uint64_t value) {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else {
        uint64_t swapped = 0;
        for (size_t i = 0; i < sizeof(value); ++i) {
            swapped = (swapped << 8) | (value & 0xFF);
            value >>= 8;
        }
        return swapped;
    }
}

inline uint16_t from_network(uint16_t value) {
    return ntohs(value);
}

inline uint32_t from_network(uint32_t value) {
    return ntohl(value);
}

inline uint64_t from_network(uint64_t value) {
    return to_network(value);  // the swap is its own inverse
}
