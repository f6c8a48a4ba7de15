#include "connector.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace drtp {

Connector::Connector(DatagramChannel &ch, const ClientConfig &cfg)
    : ch_(ch), cfg_(cfg) {}

std::error_code Connector::connect() {
  if (cfg_.requested_window == 0) {
    Logger::instance().log(LogLevel::ERROR, "requested window must be >= 1");
    return errc::handshake_failed;
  }
  int attempts = std::max(0, cfg_.syn_retries) + 1;
  for (int attempt = 0; attempt < attempts; ++attempt) {
    if (auto ec = ch_.send(make_packet(0, 0, PF_SYN, cfg_.requested_window)))
      return ec == errc::cancelled ? ec : make_error_code(errc::handshake_failed);
    Logger::instance().log(LogLevel::INFO, "SYN packet is sent%s",
                           attempt > 0 ? " (retry)" : "");

    bool timed_out = false;
    auto ec = await_syn_ack(timed_out);
    if (!timed_out)
      return ec;
    Logger::instance().log(LogLevel::WARN, "no SYN-ACK within %lld ms",
                           (long long)cfg_.proto.timeout.count());
  }
  return errc::handshake_failed;
}

std::error_code Connector::await_syn_ack(bool &timed_out) {
  auto deadline = deadline_after(cfg_.proto.timeout);
  for (;;) {
    RecvResult r = ch_.receive(deadline);
    switch (r.status) {
    case RecvStatus::Malformed:
      Logger::instance().log(LogLevel::WARN,
                             "discarding malformed packet during handshake");
      continue;
    case RecvStatus::TimedOut:
      timed_out = true;
      return errc::handshake_failed;
    case RecvStatus::Closed:
      return errc::cancelled;
    case RecvStatus::Error:
      return errc::handshake_failed;
    case RecvStatus::Packet:
      break;
    }

    const Packet &p = r.packet;
    if (!p.has(PF_SYN | PF_ACK)) {
      Logger::instance().log(LogLevel::ERROR,
                             "unexpected %s packet in handshake",
                             describe_flags(p.hdr.flags).c_str());
      return errc::handshake_failed;
    }
    Logger::instance().log(LogLevel::INFO, "SYN-ACK packet is received");
    advertised_ = p.hdr.recv_window;
    if (advertised_ == 0) {
      Logger::instance().log(LogLevel::ERROR, "server advertised a zero window");
      return errc::handshake_failed;
    }
    window_ = std::min(cfg_.requested_window, advertised_);
    Logger::instance().log(LogLevel::INFO,
                           "Effective sliding window size is set to %u "
                           "(min of sender %u and receiver %u)",
                           (unsigned)window_, (unsigned)cfg_.requested_window,
                           (unsigned)advertised_);
    if (auto ec = ch_.send(make_packet(1, 0, PF_ACK, window_)))
      return ec == errc::cancelled ? ec : make_error_code(errc::handshake_failed);
    Logger::instance().log(LogLevel::INFO, "ACK packet is sent");
    Logger::instance().log(LogLevel::INFO, "Connection established");
    established_ = true;
    return {};
  }
}

std::error_code Connector::close() {
  if (auto ec = ch_.send(make_packet(0, 0, PF_FIN, window_)))
    return ec;
  Logger::instance().log(LogLevel::INFO, "FIN packet is sent");

  auto deadline = deadline_after(cfg_.proto.timeout);
  for (;;) {
    RecvResult r = ch_.receive(deadline);
    switch (r.status) {
    case RecvStatus::Malformed:
      continue;
    case RecvStatus::TimedOut:
      Logger::instance().log(LogLevel::WARN,
                             "no FIN-ACK received, closing local half anyway");
      established_ = false;
      return errc::teardown_incomplete;
    case RecvStatus::Closed:
      return errc::cancelled;
    case RecvStatus::Error:
      return errc::transport_error;
    case RecvStatus::Packet:
      break;
    }
    if (r.packet.has(PF_FIN | PF_ACK)) {
      Logger::instance().log(LogLevel::INFO, "FIN-ACK packet is received");
      Logger::instance().log(LogLevel::INFO, "Connection closes");
      established_ = false;
      return {};
    }
    Logger::instance().log(LogLevel::DEBUG, "ignoring late %s packet ack=%u",
                           describe_flags(r.packet.hdr.flags).c_str(),
                           (unsigned)r.packet.hdr.ack);
  }
}

} // namespace drtp
