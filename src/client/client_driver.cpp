#include "client_driver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <chrono>

namespace drtp {

ClientReport run_client(DatagramChannel &ch, const ClientConfig &cfg,
                        std::vector<std::vector<uint8_t>> chunks) {
  ClientReport rep;
  rep.chunks = (uint32_t)chunks.size();
  for (const auto &c : chunks)
    rep.bytes += c.size();

  Logger::instance().log(LogLevel::INFO, "Connection Establishment Phase");
  Connector conn(ch, cfg);
  rep.ec = conn.connect();
  if (rep.ec)
    return rep;
  rep.window = conn.window();

  Logger::instance().log(LogLevel::INFO, "Data Transfer");
  auto start = std::chrono::steady_clock::now();
  WindowSender sender(ch, cfg.proto, conn.window(), std::move(chunks),
                      cfg.max_retransmits);
  rep.ec = sender.run();
  rep.stats = sender.stats();
  if (rep.ec)
    return rep;
  rep.delivered = true;

  Logger::instance().log(LogLevel::INFO, "Connection Teardown");
  rep.ec = conn.close();
  rep.seconds = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start)
                    .count();
  return rep;
}

} // namespace drtp
