#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "client_driver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "server_driver.hpp"
#include "test_channels.hpp"
#include "udp_channel.hpp"
#include "util.hpp"

using namespace drtp;
using asio::ip::udp;

namespace {

udp::endpoint loopback_any() {
  return udp::endpoint(asio::ip::make_address("127.0.0.1"), 0);
}

} // namespace

TEST(UdpChannel, ReceiveTimesOut) {
  asio::io_context io;
  UdpChannel ch(io);
  ASSERT_FALSE(ch.open_server(loopback_any()));
  auto start = std::chrono::steady_clock::now();
  RecvResult r = ch.receive(deadline_after(std::chrono::milliseconds(50)));
  EXPECT_EQ(r.status, RecvStatus::TimedOut);
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(45));
}

TEST(UdpChannel, ExchangesPacketsAndLearnsPeer) {
  asio::io_context sio, cio;
  UdpChannel server(sio), client(cio);
  ASSERT_FALSE(server.open_server(loopback_any()));
  ASSERT_FALSE(client.open_client(server.local_endpoint()));
  EXPECT_FALSE(server.peer().has_value());
  EXPECT_EQ(server.send(make_packet(0, 0, PF_ACK, 1)), errc::transport_error);

  ASSERT_FALSE(client.send(make_packet(7, 0, PF_SYN, 5, {'h', 'i'})));
  RecvResult r = server.receive(deadline_after(std::chrono::seconds(2)));
  ASSERT_EQ(r.status, RecvStatus::Packet);
  EXPECT_EQ(r.packet.hdr.seq, 7);
  EXPECT_TRUE(r.packet.has(PF_SYN));
  EXPECT_EQ(r.packet.payload, (std::vector<uint8_t>{'h', 'i'}));
  ASSERT_TRUE(server.peer().has_value());
  EXPECT_EQ(server.peer()->port(), client.local_endpoint().port());

  ASSERT_FALSE(server.send(make_packet(0, 0, PF_SYN | PF_ACK, 15)));
  r = client.receive(deadline_after(std::chrono::seconds(2)));
  ASSERT_EQ(r.status, RecvStatus::Packet);
  EXPECT_EQ(r.packet.hdr.recv_window, 15);
}

TEST(UdpChannel, ShortDatagramIsMalformed) {
  asio::io_context io;
  UdpChannel ch(io);
  ASSERT_FALSE(ch.open_server(loopback_any()));

  asio::io_context raw_io;
  udp::socket raw(raw_io, udp::endpoint(udp::v4(), 0));
  uint8_t junk[3] = {1, 2, 3};
  raw.send_to(asio::buffer(junk), ch.local_endpoint());

  RecvResult r = ch.receive(deadline_after(std::chrono::seconds(2)));
  EXPECT_EQ(r.status, RecvStatus::Malformed);
  EXPECT_FALSE(ch.peer().has_value());
}

TEST(UdpChannel, CloseFromHandlerUnblocksReceive) {
  asio::io_context io;
  UdpChannel ch(io);
  ASSERT_FALSE(ch.open_server(loopback_any()));
  asio::steady_timer timer(io, std::chrono::milliseconds(30));
  timer.async_wait([&ch](const std::error_code &ec) {
    if (!ec)
      ch.close();
  });
  RecvResult r = ch.receive(deadline_after(std::chrono::seconds(5)));
  EXPECT_EQ(r.status, RecvStatus::Closed);
  EXPECT_FALSE(ch.is_open());
  EXPECT_EQ(ch.send(make_packet(0, 0, PF_ACK, 1)), errc::cancelled);
}

TEST(UdpChannel, TransfersFileOverLoopback) {
  Logger::instance().set_level(LogLevel::WARN);
  asio::io_context sio, cio;
  UdpChannel server(sio), client(cio);
  ASSERT_FALSE(server.open_server(loopback_any()));
  ASSERT_FALSE(client.open_client(server.local_endpoint()));

  ServerConfig scfg;
  scfg.accept_timeout = std::chrono::milliseconds(2000);
  scfg.idle_timeout = std::chrono::milliseconds(3000);
  ClientConfig ccfg;
  ccfg.requested_window = 8;
  ccfg.proto.timeout = std::chrono::milliseconds(100);
  ccfg.syn_retries = 10;

  auto file = test::pattern_bytes(50000);
  std::ostringstream out;
  ServerReport srep;
  std::thread t([&] { srep = run_server(server, scfg, out); });
  ClientReport crep =
      run_client(client, ccfg, split_into_chunks(file, kMaxPayload));
  t.join();
  Logger::instance().set_level(LogLevel::INFO);

  ASSERT_FALSE(crep.ec) << crep.ec.message();
  ASSERT_FALSE(srep.ec) << srep.ec.message();
  EXPECT_EQ(crep.window, 8);
  EXPECT_EQ(out.str(), std::string(file.begin(), file.end()));
}
