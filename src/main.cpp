#include "client_driver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "server_driver.hpp"
#include "udp_channel.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>

using namespace drtp;

static void usage(const char *prog) {
  std::cerr << "usage: " << prog
            << " (-s | -c) -i <ip> -p <port> [-f <file>] [-w <window>]\n"
               "       [-d|--discard] [-o <output>] [-t <timeout ms>] [-v]\n";
}

static int exit_code_for(const std::error_code &ec) {
  if (!ec)
    return 0;
  if (ec == errc::handshake_failed)
    return 2;
  if (ec == errc::connection_timed_out)
    return 3;
  if (ec == errc::teardown_incomplete)
    return 4;
  if (ec == errc::retransmit_timeout)
    return 5;
  if (ec == errc::cancelled)
    return 130;
  return 6;
}

int main(int argc, char **argv) {
  bool server_mode = false, client_mode = false, discard = false;
  std::string ip, port_str, file, output;
  uint32_t window = 3;
  uint32_t timeout_ms = 400;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "-s")
      server_mode = true;
    else if (a == "-c")
      client_mode = true;
    else if (a == "-i")
      ip = next(i);
    else if (a == "-p")
      port_str = next(i);
    else if (a == "-f")
      file = next(i);
    else if (a == "-o")
      output = next(i);
    else if (a == "-d" || a == "--discard")
      discard = true;
    else if (a == "-v")
      Logger::instance().set_level(LogLevel::DEBUG);
    else if (a == "-w") {
      if (!parse_uint(next(i), 0x7FFF, window) || window == 0) {
        std::cerr << "window must be between 1 and 32767\n";
        return 1;
      }
    } else if (a == "-t") {
      if (!parse_uint(next(i), 600000, timeout_ms) || timeout_ms == 0) {
        std::cerr << "bad timeout\n";
        return 1;
      }
    } else {
      usage(argv[0]);
      return 1;
    }
  }

  if (server_mode == client_mode) {
    std::cerr << "[ERROR] Please specify a mode: -c (client) or -s (server)\n";
    return 1;
  }
  uint16_t port = 0;
  if (ip.empty() || !parse_port(port_str, port)) {
    usage(argv[0]);
    return 1;
  }
  std::error_code ec;
  auto addr = asio::ip::make_address(ip, ec);
  if (ec) {
    std::cerr << "bad ip address: " << ip << "\n";
    return 1;
  }
  asio::ip::udp::endpoint ep(addr, port);

  ProtocolConfig proto;
  proto.timeout = std::chrono::milliseconds(timeout_ms);

  asio::io_context io;
  UdpChannel ch(io);
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&ch](const std::error_code &ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::WARN, "signal %d, closing socket", sig);
    ch.close();
  });

  int rc = 0;
  if (client_mode) {
    if (file.empty()) {
      std::cerr << "[ERROR] Client mode requires a filename (-f)\n";
      return 1;
    }
    std::vector<std::vector<uint8_t>> chunks;
    uint64_t total_bytes = 0;
    if (!read_file_chunks(file, proto.chunk_size, chunks, total_bytes)) {
      std::cerr << "[ERROR] cannot read " << file << "\n";
      return 1;
    }
    if (auto oec = ch.open_client(ep)) {
      Logger::instance().log(LogLevel::ERROR, "socket setup failed: %s",
                             oec.message().c_str());
      return 6;
    }

    ClientConfig cfg;
    cfg.proto = proto;
    cfg.requested_window = (uint16_t)window;
    ClientReport rep = run_client(ch, cfg, std::move(chunks));
    if (rep.delivered)
      Logger::instance().log(LogLevel::INFO, "The throughput is %.2f Mbps",
                             throughput_mbps(total_bytes, rep.seconds));
    if (rep.ec)
      Logger::instance().log(rep.ec == errc::teardown_incomplete
                                 ? LogLevel::WARN
                                 : LogLevel::ERROR,
                             "client finished: %s", rep.ec.message().c_str());
    rc = exit_code_for(rep.ec);
  } else {
    if (output.empty())
      output = "received_file_" + std::to_string((long long)std::time(nullptr));
    if (auto oec = ch.open_server(ep)) {
      Logger::instance().log(LogLevel::ERROR, "bind %s:%u failed: %s",
                             ip.c_str(), (unsigned)port,
                             oec.message().c_str());
      return 6;
    }
    Logger::instance().log(LogLevel::INFO, "Listening on %s:%u", ip.c_str(),
                           (unsigned)port);
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "[ERROR] cannot open " << output << "\n";
      return 1;
    }

    ServerConfig cfg;
    cfg.proto = proto;
    cfg.discard_first = discard;
    ServerReport rep = run_server(ch, cfg, out);
    out.close();
    if (rep.complete) {
      Logger::instance().log(LogLevel::INFO, "wrote %llu bytes to %s",
                             (unsigned long long)rep.bytes, output.c_str());
      Logger::instance().log(LogLevel::INFO, "The throughput is %.2f Mbps",
                             throughput_mbps(rep.bytes, rep.seconds));
    } else if (rep.bytes > 0) {
      Logger::instance().log(LogLevel::WARN, "%s is incomplete (%llu bytes)",
                             output.c_str(), (unsigned long long)rep.bytes);
    }
    Logger::instance().log(LogLevel::INFO, "Connection closes");
    rc = exit_code_for(rep.ec);
  }

  std::error_code ignored;
  signals.cancel(ignored);
  ch.close();
  return rc;
}
