#pragma once
#include <cstdint>
#include <ostream>
#include <system_error>
#include "acceptor.hpp"
#include "channel.hpp"
#include "reliable_receiver.hpp"

namespace drtp {

struct ServerReport {
    std::error_code ec;
    uint16_t window{0};
    uint64_t bytes{0};
    double seconds{0.0};   // connection established -> FIN handled
    bool complete{false};  // FIN observed; otherwise the output is partial
    ReceiverStats stats;
};

// Accepts one connection and writes its payload to out.
ServerReport run_server(DatagramChannel& ch, const ServerConfig& cfg, std::ostream& out);

} // namespace drtp
