#pragma once
#include <cstdint>
#include <system_error>
#include <vector>
#include "channel.hpp"
#include "protocol.hpp"

namespace drtp {

struct SenderStats {
    uint64_t packets_sent{0};
    uint64_t retransmissions{0};
    uint64_t timeouts{0};
    uint64_t stale_acks{0};
};

// Go-Back-N sender. Chunk i travels with seq = i mod 2^16; acks are
// cumulative ("next expected seq") and are mapped back to absolute chunk
// indices relative to base, which requires window < 32768.
class WindowSender {
public:
    WindowSender(DatagramChannel& ch, const ProtocolConfig& proto, uint16_t window,
                 std::vector<std::vector<uint8_t>> chunks, uint32_t max_retransmits = 0);

    // Returns once every chunk is acknowledged.
    std::error_code run();

    uint32_t base() const { return base_; }
    uint32_t next_seq() const { return next_seq_; }
    uint32_t total() const { return (uint32_t)chunks_.size(); }
    uint16_t window() const { return window_; }
    const SenderStats& stats() const { return stats_; }

private:
    std::error_code fill();
    bool on_ack(uint16_t ack);

    DatagramChannel& ch_;
    ProtocolConfig proto_;
    uint16_t window_;
    std::vector<std::vector<uint8_t>> chunks_;
    uint32_t max_retransmits_;
    uint32_t base_{0};
    uint32_t next_seq_{0};
    uint32_t highest_sent_{0};
    SenderStats stats_;
};

} // namespace drtp
