#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include "channel.hpp"
#include "protocol.hpp"

namespace drtp {

struct ServerConfig {
    ProtocolConfig proto;
    uint16_t advertised_window{15};
    std::chrono::milliseconds accept_timeout{0}; // 0 = wait forever for a SYN
    std::chrono::milliseconds idle_timeout{5000};
    bool discard_first{false};
};

// Server half of the three-way handshake.
class Acceptor {
public:
    Acceptor(DatagramChannel& ch, const ServerConfig& cfg);

    std::error_code accept();

    // A DATA or FIN packet that stood in for the lost handshake ACK. It still
    // has to be processed by the receiver.
    std::optional<Packet> take_early_packet();

    uint16_t window() const { return window_; }
    uint16_t requested_window() const { return requested_; }

private:
    std::error_code send_syn_ack();

    DatagramChannel& ch_;
    ServerConfig cfg_;
    uint16_t requested_{0};
    uint16_t window_{0};
    std::optional<Packet> early_;
};

} // namespace drtp
