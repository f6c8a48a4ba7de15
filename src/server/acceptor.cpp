#include "acceptor.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace drtp {

Acceptor::Acceptor(DatagramChannel &ch, const ServerConfig &cfg)
    : ch_(ch), cfg_(cfg) {}

std::error_code Acceptor::send_syn_ack() {
  if (auto ec = ch_.send(make_packet(0, 0, PF_SYN | PF_ACK,
                                     cfg_.advertised_window)))
    return ec == errc::cancelled ? ec : make_error_code(errc::handshake_failed);
  Logger::instance().log(LogLevel::INFO, "SYN-ACK packet is sent");
  return {};
}

std::optional<Packet> Acceptor::take_early_packet() {
  std::optional<Packet> p = std::move(early_);
  early_.reset();
  return p;
}

std::error_code Acceptor::accept() {
  early_.reset();
  if (cfg_.advertised_window == 0)
    return errc::handshake_failed;

  auto deadline = deadline_after(cfg_.accept_timeout);
  for (;;) {
    RecvResult r = ch_.receive(deadline);
    if (r.status == RecvStatus::Malformed) {
      Logger::instance().log(LogLevel::WARN, "discarding malformed packet");
      continue;
    }
    if (r.status == RecvStatus::Closed)
      return errc::cancelled;
    if (r.status != RecvStatus::Packet) {
      Logger::instance().log(LogLevel::ERROR, "no SYN received");
      return errc::handshake_failed;
    }
    if (!r.packet.has(PF_SYN) || r.packet.has(PF_ACK)) {
      Logger::instance().log(LogLevel::ERROR,
                             "Expected SYN, received unexpected %s packet",
                             describe_flags(r.packet.hdr.flags).c_str());
      return errc::handshake_failed;
    }
    requested_ = r.packet.hdr.recv_window;
    Logger::instance().log(LogLevel::INFO,
                           "SYN packet is received (requested window %u)",
                           (unsigned)requested_);
    break;
  }

  if (auto ec = send_syn_ack())
    return ec;

  deadline = deadline_after(cfg_.proto.timeout);
  for (;;) {
    RecvResult r = ch_.receive(deadline);
    switch (r.status) {
    case RecvStatus::Malformed:
      continue;
    case RecvStatus::TimedOut:
      Logger::instance().log(LogLevel::ERROR, "no ACK for SYN-ACK");
      return errc::handshake_failed;
    case RecvStatus::Closed:
      return errc::cancelled;
    case RecvStatus::Error:
      return errc::handshake_failed;
    case RecvStatus::Packet:
      break;
    }

    const Packet &p = r.packet;
    if (p.has(PF_SYN) && !p.has(PF_ACK)) {
      // The client missed our SYN-ACK and retried.
      if (auto ec = send_syn_ack())
        return ec;
      deadline = deadline_after(cfg_.proto.timeout);
      continue;
    }
    // DATA or FIN means our ACK was lost on the way; both carry the
    // negotiated window, so the first one completes the handshake.
    bool implicit = p.is_data() || (p.has(PF_FIN) && !p.has(PF_SYN));
    if (!implicit && (!p.has(PF_ACK) || p.has(PF_SYN) || p.has(PF_FIN))) {
      Logger::instance().log(LogLevel::ERROR,
                             "Invalid ACK (%s), closing connection",
                             describe_flags(p.hdr.flags).c_str());
      return errc::handshake_failed;
    }
    window_ = p.hdr.recv_window;
    if (window_ == 0) {
      Logger::instance().log(LogLevel::ERROR, "client negotiated a zero window");
      return errc::handshake_failed;
    }
    if (window_ > cfg_.advertised_window) {
      Logger::instance().log(LogLevel::WARN,
                             "client window %u exceeds advertised %u, clamping",
                             (unsigned)window_,
                             (unsigned)cfg_.advertised_window);
      window_ = cfg_.advertised_window;
    }
    if (implicit) {
      Logger::instance().log(LogLevel::WARN,
                             "handshake ACK missing, %s packet completes it",
                             describe_flags(p.hdr.flags).c_str());
      early_ = std::move(r.packet);
    } else {
      Logger::instance().log(LogLevel::INFO, "ACK packet is received");
    }
    Logger::instance().log(LogLevel::INFO, "Connection established (window %u)",
                           (unsigned)window_);
    return {};
  }
}

} // namespace drtp
