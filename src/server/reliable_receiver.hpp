#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <system_error>
#include <vector>
#include "acceptor.hpp"
#include "channel.hpp"
#include "protocol.hpp"

namespace drtp {

struct ReceiverStats {
    uint64_t bytes_written{0};
    uint64_t packets_accepted{0};
    uint64_t packets_buffered{0};
    uint64_t duplicates{0};
    uint64_t discarded{0};
};

// Receives DATA until FIN. Payloads reach `out` strictly in sequence order;
// arrivals ahead of expected_seq are held while they fit in the window.
// Every DATA packet is answered with a cumulative ACK (ack = expected_seq).
class ReliableReceiver {
public:
    ReliableReceiver(DatagramChannel& ch, std::ostream& out, uint16_t window,
                     const ServerConfig& cfg);

    // Success once FIN was answered with FIN|ACK; connection_timed_out when
    // the peer goes quiet first. `first` is processed before anything is read
    // from the channel.
    std::error_code run(std::optional<Packet> first = std::nullopt);

    uint32_t expected_seq() const { return expected_seq_; }
    bool finished() const { return finished_; }
    size_t buffered() const { return reorder_.size(); }
    const ReceiverStats& stats() const { return stats_; }

private:
    std::error_code on_packet(const Packet& p);
    std::error_code on_data(const Packet& p);
    std::error_code deliver(const std::vector<uint8_t>& payload);
    std::error_code send_ack();

    DatagramChannel& ch_;
    std::ostream& out_;
    uint16_t window_;
    ServerConfig cfg_;
    uint32_t expected_seq_{0};
    bool seen_data_{false};
    bool discarded_{false};
    bool finished_{false};
    std::map<uint32_t, std::vector<uint8_t>> reorder_;
    ReceiverStats stats_;
};

} // namespace drtp
