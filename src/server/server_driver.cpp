#include "server_driver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <chrono>

namespace drtp {

ServerReport run_server(DatagramChannel &ch, const ServerConfig &cfg,
                        std::ostream &out) {
  ServerReport rep;
  Acceptor acc(ch, cfg);
  rep.ec = acc.accept();
  if (rep.ec)
    return rep;
  rep.window = acc.window();

  Logger::instance().log(LogLevel::INFO, "Data Transfer");
  auto start = std::chrono::steady_clock::now();
  ReliableReceiver rx(ch, out, acc.window(), cfg);
  rep.ec = rx.run(acc.take_early_packet());
  rep.seconds = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start)
                    .count();
  rep.stats = rx.stats();
  rep.bytes = rx.stats().bytes_written;
  rep.complete = rx.finished() && !rep.ec;
  if (!rep.complete)
    Logger::instance().log(LogLevel::WARN,
                           "transfer incomplete: %llu bytes written (%s)",
                           (unsigned long long)rep.bytes,
                           rep.ec ? rep.ec.message().c_str() : "no FIN");
  return rep;
}

} // namespace drtp
