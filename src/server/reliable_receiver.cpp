#include "reliable_receiver.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace drtp {

ReliableReceiver::ReliableReceiver(DatagramChannel &ch, std::ostream &out,
                                   uint16_t window, const ServerConfig &cfg)
    : ch_(ch), out_(out), window_(window), cfg_(cfg) {}

std::error_code ReliableReceiver::deliver(const std::vector<uint8_t> &payload) {
  if (!payload.empty()) {
    out_.write(reinterpret_cast<const char *>(payload.data()),
               (std::streamsize)payload.size());
    if (!out_) {
      Logger::instance().log(LogLevel::ERROR, "write to output failed");
      return errc::output_failed;
    }
  }
  stats_.bytes_written += payload.size();
  stats_.packets_accepted++;
  expected_seq_++;
  return {};
}

std::error_code ReliableReceiver::send_ack() {
  uint16_t ack = (uint16_t)expected_seq_;
  if (auto ec = ch_.send(make_packet(0, ack, PF_ACK, window_)))
    return ec == errc::cancelled ? ec : make_error_code(errc::transport_error);
  Logger::instance().log(LogLevel::DEBUG, "sending ACK %u", (unsigned)ack);
  return {};
}

std::error_code ReliableReceiver::on_data(const Packet &p) {
  seen_data_ = true;
  // Offset of seq ahead of expected_seq on the 16-bit circle; values in the
  // upper half are behind it (already delivered).
  uint16_t offset = (uint16_t)(p.hdr.seq - (uint16_t)expected_seq_);

  if (offset == 0) {
    Logger::instance().log(LogLevel::INFO, "packet %u is received",
                           (unsigned)p.hdr.seq);
    if (auto ec = deliver(p.payload))
      return ec;
    auto it = reorder_.find(expected_seq_);
    while (it != reorder_.end()) {
      if (auto ec = deliver(it->second))
        return ec;
      reorder_.erase(it);
      it = reorder_.find(expected_seq_);
    }
  } else if (offset < window_) {
    uint32_t abs_seq = expected_seq_ + offset;
    if (reorder_.emplace(abs_seq, p.payload).second) {
      stats_.packets_buffered++;
      Logger::instance().log(LogLevel::INFO,
                             "packet %u is received out of order, buffered "
                             "(expecting %u)",
                             (unsigned)p.hdr.seq, (unsigned)(uint16_t)expected_seq_);
    } else {
      stats_.duplicates++;
    }
  } else {
    stats_.duplicates++;
    Logger::instance().log(LogLevel::INFO,
                           "packet %u is a duplicate or outside the window, "
                           "dropped (expecting %u)",
                           (unsigned)p.hdr.seq, (unsigned)(uint16_t)expected_seq_);
  }
  Logger::instance().log(LogLevel::INFO, "sending ack for the received %u",
                         (unsigned)p.hdr.seq);
  return send_ack();
}

std::error_code ReliableReceiver::on_packet(const Packet &p) {
  if (cfg_.discard_first && !discarded_ && p.is_data() && !p.payload.empty()) {
    discarded_ = true;
    stats_.discarded++;
    Logger::instance().log(LogLevel::INFO,
                           "Intentionally discarding packet with seq = %u",
                           (unsigned)p.hdr.seq);
    return {};
  }

  if (p.has(PF_FIN)) {
    Logger::instance().log(LogLevel::INFO, "FIN packet is received");
    out_.flush();
    if (auto ec = ch_.send(make_packet(0, 0, PF_FIN | PF_ACK, 0)))
      return ec == errc::cancelled ? ec
                                   : make_error_code(errc::transport_error);
    Logger::instance().log(LogLevel::INFO, "FIN ACK packet is sent");
    finished_ = true;
    if (!reorder_.empty())
      Logger::instance().log(LogLevel::WARN,
                             "%zu buffered packets never became contiguous",
                             reorder_.size());
    return out_ ? std::error_code() : make_error_code(errc::output_failed);
  }

  if (p.has(PF_SYN) && !p.has(PF_ACK)) {
    if (!seen_data_) {
      if (auto ec = ch_.send(
              make_packet(0, 0, PF_SYN | PF_ACK, cfg_.advertised_window)))
        return ec == errc::cancelled ? ec
                                     : make_error_code(errc::transport_error);
      Logger::instance().log(LogLevel::INFO, "SYN-ACK packet is resent");
    }
    return {};
  }
  if (!p.is_data()) {
    Logger::instance().log(LogLevel::DEBUG, "ignoring stray %s packet",
                           describe_flags(p.hdr.flags).c_str());
    return {};
  }
  return on_data(p);
}

std::error_code ReliableReceiver::run(std::optional<Packet> first) {
  finished_ = false;
  if (first) {
    if (auto ec = on_packet(*first))
      return ec;
    if (finished_)
      return {};
  }
  for (;;) {
    RecvResult r = ch_.receive(deadline_after(cfg_.idle_timeout));
    switch (r.status) {
    case RecvStatus::Malformed:
      Logger::instance().log(LogLevel::WARN, "discarding malformed packet");
      continue;
    case RecvStatus::TimedOut:
      Logger::instance().log(LogLevel::ERROR,
                             "Timeout waiting for data, transfer incomplete");
      out_.flush();
      return errc::connection_timed_out;
    case RecvStatus::Closed:
      out_.flush();
      return errc::cancelled;
    case RecvStatus::Error:
      out_.flush();
      return errc::transport_error;
    case RecvStatus::Packet:
      break;
    }

    if (auto ec = on_packet(r.packet))
      return ec;
    if (finished_)
      return {};
  }
}

} // namespace drtp
