#pragma once
#include <chrono>
#include <system_error>
#include "protocol.hpp"

namespace drtp {

enum class RecvStatus { Packet, TimedOut, Malformed, Closed, Error };

struct RecvResult {
    RecvStatus status{RecvStatus::TimedOut};
    Packet packet;
    std::error_code ec;
};

// One datagram per packet. receive() is the only blocking point of the
// protocol engines; close() must unblock a pending receive with Closed.
class DatagramChannel {
public:
    using clock = std::chrono::steady_clock;
    virtual ~DatagramChannel() = default;
    virtual std::error_code send(const Packet& p) = 0;
    virtual RecvResult receive(clock::time_point deadline) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

inline DatagramChannel::clock::time_point deadline_after(std::chrono::milliseconds d) {
    if (d.count() <= 0)
        return DatagramChannel::clock::time_point::max();
    return DatagramChannel::clock::now() + d;
}

} // namespace drtp
