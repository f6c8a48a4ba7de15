#include "udp_channel.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace drtp {

UdpChannel::UdpChannel(asio::io_context &io)
    : io_(io), socket_(io), rx_buf_(64 * 1024) {}

UdpChannel::~UdpChannel() {
  std::error_code ec;
  socket_.close(ec);
}

std::error_code UdpChannel::open_client(const udp::endpoint &server) {
  std::error_code ec;
  socket_.open(server.protocol(), ec);
  if (ec)
    return ec;
  socket_.bind(udp::endpoint(server.protocol(), 0), ec);
  if (ec)
    return ec;
  peer_ = server;
  learn_peer_ = false;
  closed_ = false;
  return {};
}

std::error_code UdpChannel::open_server(const udp::endpoint &listen) {
  std::error_code ec;
  socket_.open(listen.protocol(), ec);
  if (ec)
    return ec;
  socket_.set_option(udp::socket::reuse_address(true), ec);
  if (ec)
    return ec;
  socket_.bind(listen, ec);
  if (ec)
    return ec;
  peer_.reset();
  learn_peer_ = true;
  closed_ = false;
  return {};
}

udp::endpoint UdpChannel::local_endpoint() const {
  std::error_code ec;
  auto ep = socket_.local_endpoint(ec);
  return ec ? udp::endpoint() : ep;
}

std::error_code UdpChannel::send(const Packet &p) {
  if (closed_)
    return errc::cancelled;
  if (!peer_)
    return errc::transport_error;
  if (!encode_packet(p, tx_buf_))
    return errc::malformed_packet;
  std::error_code ec;
  socket_.send_to(asio::buffer(tx_buf_), *peer_, 0, ec);
  if (ec) {
    if (closed_)
      return errc::cancelled;
    Logger::instance().log(LogLevel::ERROR, "send failed: %s",
                           ec.message().c_str());
    return ec;
  }
  return {};
}

RecvResult UdpChannel::receive(clock::time_point deadline) {
  RecvResult r;
  for (;;) {
    if (closed_ || !socket_.is_open()) {
      r.status = RecvStatus::Closed;
      r.ec = errc::cancelled;
      return r;
    }

    bool done = false;
    std::error_code ec;
    std::size_t n = 0;
    udp::endpoint from;
    socket_.async_receive_from(asio::buffer(rx_buf_), from,
                               [&](std::error_code e, std::size_t len) {
                                 ec = e;
                                 n = len;
                                 done = true;
                               });
    io_.restart();
    io_.poll();
    while (!done && io_.run_one_until(deadline) > 0) {
    }
    if (!done) {
      std::error_code ignored;
      socket_.cancel(ignored);
      io_.restart();
      while (!done && io_.run_one() > 0) {
      }
    }

    if (closed_) {
      r.status = RecvStatus::Closed;
      r.ec = errc::cancelled;
      return r;
    }
    if (ec == asio::error::operation_aborted) {
      r.status = RecvStatus::TimedOut;
      return r;
    }
    if (ec) {
      Logger::instance().log(LogLevel::ERROR, "receive failed: %s",
                             ec.message().c_str());
      r.status = RecvStatus::Error;
      r.ec = ec;
      return r;
    }
    if (peer_ && from != *peer_) {
      Logger::instance().log(LogLevel::DEBUG,
                             "ignoring datagram from foreign endpoint %s:%u",
                             from.address().to_string().c_str(),
                             (unsigned)from.port());
      continue;
    }

    auto pkt = decode_packet(rx_buf_.data(), n);
    if (!pkt) {
      r.status = RecvStatus::Malformed;
      r.ec = errc::malformed_packet;
      return r;
    }
    if (!peer_ && learn_peer_) {
      peer_ = from;
      Logger::instance().log(LogLevel::DEBUG, "peer is %s:%u",
                             from.address().to_string().c_str(),
                             (unsigned)from.port());
    }
    r.status = RecvStatus::Packet;
    r.packet = std::move(*pkt);
    return r;
  }
}

void UdpChannel::close() {
  if (closed_)
    return;
  closed_ = true;
  std::error_code ec;
  socket_.close(ec);
}

} // namespace drtp
