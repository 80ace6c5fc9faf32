#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <type_traits>

#include "protocol.h"

// Message validation utilities
// Every parse_* returns std::nullopt for foreign or truncated traffic; none of them throw.
namespace message_validator {

inline bool is_valid_offer(size_t bytes) {
    return bytes >= sizeof(OfferHdr);
}

inline bool is_valid_request(size_t bytes) {
    return bytes >= sizeof(RequestHdr);
}

inline bool is_valid_payload(size_t bytes) {
    return bytes >= sizeof(PayloadHdr);
}

// Check magic and type of a buffer already known to hold at least a MsgHdr
inline bool matches(const unsigned char* data, MsgType expected) {
    MsgHdr hdr{};
    std::memcpy(&hdr, data, sizeof(MsgHdr));
    return from_network(hdr.magic) == PROTOCOL_MAGIC && hdr.type == expected;
}

inline std::optional<Offer> parse_offer(const unsigned char* data, size_t bytes) {
    if (!is_valid_offer(bytes) || !matches(data, MsgType::OFFER)) {
        return std::nullopt;
    }
    OfferHdr ohdr{};
    std::memcpy(&ohdr, data, sizeof(OfferHdr));
    return Offer{from_network(ohdr.udp_port), from_network(ohdr.tcp_port)};
}

// Returns the requested file size
inline std::optional<uint64_t> parse_request(const unsigned char* data, size_t bytes) {
    if (!is_valid_request(bytes) || !matches(data, MsgType::REQUEST)) {
        return std::nullopt;
    }
    RequestHdr rhdr{};
    std::memcpy(&rhdr, data, sizeof(RequestHdr));
    return from_network(rhdr.file_size);
}

inline std::optional<PayloadInfo> parse_payload(const unsigned char* data, size_t bytes) {
    if (!is_valid_payload(bytes) || !matches(data, MsgType::PAYLOAD)) {
        return std::nullopt;
    }
    PayloadHdr phdr{};
    std::memcpy(&phdr, data, sizeof(PayloadHdr));
    return PayloadInfo{from_network(phdr.total_segments), from_network(phdr.segment_index)};
}

// Strict unsigned decimal: digits only, no sign, no trailing garbage, no overflow
template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
    static_assert(std::is_unsigned_v<T>);
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    auto [end, error_code] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error_code != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Parse the reliable path's "<decimal>\n" request line (terminator already stripped or not)
inline std::optional<uint64_t> parse_size_request(std::string_view line) {
    constexpr std::string_view WHITESPACE = " \t\r\n";
    auto first = line.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto last = line.find_last_not_of(WHITESPACE);
    return parse_unsigned<uint64_t>(line.substr(first, last - first + 1));
}

}  // namespace message_validator
