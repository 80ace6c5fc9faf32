#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "protocol.h"

// Helper utilities for building network packets
namespace packet_builder {

// Filler byte for payload padding and the reliable stream; receivers ignore the content
constexpr unsigned char FILLER_BYTE = 'X';

// Create the offer a server broadcasts on the discovery port
inline std::array<unsigned char, sizeof(OfferHdr)> create_offer_packet(uint16_t udp_port,
                                                                       uint16_t tcp_port) {
    OfferHdr ohdr{};
    ohdr.magic    = to_network(PROTOCOL_MAGIC);
    ohdr.type     = MsgType::OFFER;
    ohdr.udp_port = to_network(udp_port);
    ohdr.tcp_port = to_network(tcp_port);

    std::array<unsigned char, sizeof(OfferHdr)> buf{};
    std::memcpy(buf.data(), &ohdr, sizeof(OfferHdr));
    return buf;
}

// Create an unreliable transfer request for file_size bytes
inline std::array<unsigned char, sizeof(RequestHdr)> create_request_packet(uint64_t file_size) {
    RequestHdr rhdr{};
    rhdr.magic     = to_network(PROTOCOL_MAGIC);
    rhdr.type      = MsgType::REQUEST;
    rhdr.file_size = to_network(file_size);

    std::array<unsigned char, sizeof(RequestHdr)> buf{};
    std::memcpy(buf.data(), &rhdr, sizeof(RequestHdr));
    return buf;
}

// Overwrite the header of a payload datagram in place (buffer must hold SEGMENT_SIZE bytes)
inline void write_payload_header(unsigned char* packet_data, uint64_t total_segments,
                                 uint64_t segment_index) {
    PayloadHdr phdr{};
    phdr.magic          = to_network(PROTOCOL_MAGIC);
    phdr.type           = MsgType::PAYLOAD;
    phdr.total_segments = to_network(total_segments);
    phdr.segment_index  = to_network(segment_index);
    std::memcpy(packet_data, &phdr, sizeof(PayloadHdr));
}

// Create a full SEGMENT_SIZE payload datagram
// Returns shared_ptr for async send safety
inline std::shared_ptr<std::vector<unsigned char>> create_payload_packet(uint64_t total_segments,
                                                                         uint64_t segment_index) {
    auto packet = std::make_shared<std::vector<unsigned char>>(SEGMENT_SIZE, FILLER_BYTE);
    write_payload_header(packet->data(), total_segments, segment_index);
    return packet;
}

// The reliable path asks for its size as a decimal text line
inline std::string create_size_request(uint64_t file_size) {
    return std::to_string(file_size) + "\n";
}

}  // namespace packet_builder
