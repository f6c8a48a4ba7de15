#pragma once
#include <cstdint>
#include <system_error>
#include "channel.hpp"
#include "protocol.hpp"

namespace drtp {

// Consecutive timeouts without progress before the sender gives up.
constexpr uint32_t kDefaultMaxRetransmits = 25;

struct ClientConfig {
    ProtocolConfig proto;
    uint16_t requested_window{3};
    int syn_retries{0};
    uint32_t max_retransmits{kDefaultMaxRetransmits}; // 0 = no limit
};

// Client half of the three-way handshake and of the teardown exchange.
class Connector {
public:
    Connector(DatagramChannel& ch, const ClientConfig& cfg);

    // SYN -> SYN|ACK -> ACK. On success window() is min(requested, advertised).
    std::error_code connect();

    // FIN -> FIN|ACK. teardown_incomplete when no FIN|ACK arrives in time.
    std::error_code close();

    uint16_t window() const { return window_; }
    uint16_t advertised_window() const { return advertised_; }
    bool established() const { return established_; }

private:
    std::error_code await_syn_ack(bool& timed_out);

    DatagramChannel& ch_;
    ClientConfig cfg_;
    uint16_t window_{0};
    uint16_t advertised_{0};
    bool established_{false};
};

} // namespace drtp
