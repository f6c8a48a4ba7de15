#include "window_sender.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace drtp {

WindowSender::WindowSender(DatagramChannel &ch, const ProtocolConfig &proto,
                           uint16_t window,
                           std::vector<std::vector<uint8_t>> chunks,
                           uint32_t max_retransmits)
    : ch_(ch), proto_(proto), window_(window), chunks_(std::move(chunks)),
      max_retransmits_(max_retransmits) {}

std::error_code WindowSender::fill() {
  const uint32_t total = (uint32_t)chunks_.size();
  while (next_seq_ < base_ + window_ && next_seq_ < total) {
    Packet p = make_packet((uint16_t)next_seq_, 0, 0, window_,
                           chunks_[next_seq_]);
    if (auto ec = ch_.send(p))
      return ec == errc::cancelled ? ec : make_error_code(errc::transport_error);
    stats_.packets_sent++;
    if (next_seq_ < highest_sent_)
      stats_.retransmissions++;
    Logger::instance().log(LogLevel::INFO,
                           "packet with seq = %u is sent, sliding window = %s",
                           next_seq_, format_window(base_, next_seq_).c_str());
    next_seq_++;
    if (next_seq_ > highest_sent_)
      highest_sent_ = next_seq_;
  }
  return {};
}

bool WindowSender::on_ack(uint16_t ack) {
  // Distance from base on the 16-bit circle. Anything outside
  // (0, next_seq - base] is stale or was never sent.
  uint16_t delta = (uint16_t)(ack - (uint16_t)base_);
  if (delta == 0 || delta > next_seq_ - base_) {
    stats_.stale_acks++;
    Logger::instance().log(LogLevel::DEBUG, "ignoring stale ACK %u (base = %u)",
                           (unsigned)ack, base_);
    return false;
  }
  base_ += delta;
  Logger::instance().log(LogLevel::INFO,
                         "ACK for packet = %u is received, base = %u",
                         (unsigned)(uint16_t)(base_ - 1), base_);
  return true;
}

std::error_code WindowSender::run() {
  if (window_ == 0 || window_ >= 0x8000)
    return errc::handshake_failed;
  const uint32_t total = (uint32_t)chunks_.size();
  uint32_t consecutive_timeouts = 0;
  auto deadline = deadline_after(proto_.timeout);

  while (base_ < total) {
    if (auto ec = fill())
      return ec;

    RecvResult r = ch_.receive(deadline);
    switch (r.status) {
    case RecvStatus::Packet:
      if (!r.packet.has(PF_ACK) || r.packet.has(PF_SYN) ||
          r.packet.has(PF_FIN)) {
        Logger::instance().log(LogLevel::WARN,
                               "ignoring unexpected %s packet during transfer",
                               describe_flags(r.packet.hdr.flags).c_str());
        break;
      }
      if (on_ack(r.packet.hdr.ack)) {
        consecutive_timeouts = 0;
        deadline = deadline_after(proto_.timeout);
      }
      break;
    case RecvStatus::Malformed:
      Logger::instance().log(LogLevel::WARN, "discarding malformed packet");
      break;
    case RecvStatus::TimedOut:
      stats_.timeouts++;
      consecutive_timeouts++;
      if (max_retransmits_ != 0 && consecutive_timeouts > max_retransmits_) {
        Logger::instance().log(LogLevel::ERROR,
                               "giving up after %u timeouts at base = %u",
                               consecutive_timeouts, base_);
        return errc::retransmit_timeout;
      }
      Logger::instance().log(LogLevel::WARN,
                             "Timeout! Resending from base = %u", base_);
      next_seq_ = base_;
      deadline = deadline_after(proto_.timeout);
      break;
    case RecvStatus::Closed:
      return errc::cancelled;
    case RecvStatus::Error:
      return errc::transport_error;
    }
  }
  Logger::instance().log(LogLevel::INFO,
                         "all %u packets acknowledged (%llu sent, %llu "
                         "retransmitted)",
                         total, (unsigned long long)stats_.packets_sent,
                         (unsigned long long)stats_.retransmissions);
  return {};
}

} // namespace drtp
