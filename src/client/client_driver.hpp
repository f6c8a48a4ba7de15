#pragma once
#include <cstdint>
#include <system_error>
#include <vector>
#include "channel.hpp"
#include "connector.hpp"
#include "window_sender.hpp"

namespace drtp {

struct ClientReport {
    std::error_code ec;          // first terminal outcome, empty on success
    uint16_t window{0};
    uint32_t chunks{0};
    uint64_t bytes{0};
    double seconds{0.0};         // connection established -> teardown done
    bool delivered{false};       // every chunk acknowledged
    SenderStats stats;
};

// Handshake, Go-Back-N transfer of chunks, teardown.
ClientReport run_client(DatagramChannel& ch, const ClientConfig& cfg,
                        std::vector<std::vector<uint8_t>> chunks);

} // namespace drtp
