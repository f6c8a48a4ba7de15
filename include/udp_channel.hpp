#pragma once
#include <asio.hpp>
#include <optional>
#include <vector>
#include "channel.hpp"

namespace drtp {

// Blocking-with-deadline UDP channel driven by a private run of the
// io_context. Handlers registered by others on the same context (for
// example a signal_set) run while a receive is pending.
class UdpChannel : public DatagramChannel {
public:
    using udp = asio::ip::udp;
    explicit UdpChannel(asio::io_context& io);
    ~UdpChannel() override;

    // Binds an ephemeral port and sends everything to server.
    std::error_code open_client(const udp::endpoint& server);
    // Binds listen and adopts the source of the first valid packet as peer.
    std::error_code open_server(const udp::endpoint& listen);

    std::error_code send(const Packet& p) override;
    RecvResult receive(clock::time_point deadline) override;
    void close() override;
    bool is_open() const override { return !closed_ && socket_.is_open(); }

    std::optional<udp::endpoint> peer() const { return peer_; }
    udp::endpoint local_endpoint() const;

private:
    asio::io_context& io_;
    udp::socket socket_;
    std::optional<udp::endpoint> peer_;
    bool learn_peer_{false};
    bool closed_{false};
    std::vector<uint8_t> rx_buf_;
    std::vector<uint8_t> tx_buf_;
};

} // namespace drtp
