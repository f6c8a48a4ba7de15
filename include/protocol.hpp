#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace drtp {

constexpr size_t kHeaderSize = 8;
constexpr size_t kMaxDatagram = 1000;
constexpr size_t kMaxPayload = kMaxDatagram - kHeaderSize; // 992

enum PacketFlags : uint16_t {
    PF_ACK = 0x01,
    PF_SYN = 0x02,
    PF_FIN = 0x04
};

// Host-order view of the 8-byte wire header.
struct PacketHeader {
    uint16_t seq{0};
    uint16_t ack{0};
    uint16_t flags{0};
    uint16_t recv_window{0};
};

struct Packet {
    PacketHeader hdr{};
    std::vector<uint8_t> payload;

    bool has(uint16_t f) const { return (hdr.flags & f) == f; }
    bool is_data() const { return (hdr.flags & (PF_ACK | PF_SYN | PF_FIN)) == 0; }
};

Packet make_packet(uint16_t seq, uint16_t ack, uint16_t flags, uint16_t recv_window,
                   std::vector<uint8_t> payload = {});

// Writes 8 + payload bytes, header fields big-endian in order
// seq, ack, flags, recv_window. Fails if the payload exceeds kMaxPayload.
bool encode_packet(const Packet& p, std::vector<uint8_t>& out);

// Exact inverse of encode_packet. Empty when len < kHeaderSize.
std::optional<Packet> decode_packet(const uint8_t* data, size_t len);

std::string describe_flags(uint16_t flags);

// Protocol constants shared by both roles.
struct ProtocolConfig {
    std::chrono::milliseconds timeout{400};
    size_t chunk_size{kMaxPayload};
};

} // namespace drtp
