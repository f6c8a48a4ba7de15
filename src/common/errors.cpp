#include "errors.hpp"
#include <string>

namespace drtp {

namespace {

class DrtpCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "drtp"; }
  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::malformed_packet:
      return "malformed packet";
    case errc::handshake_failed:
      return "handshake failed";
    case errc::retransmit_timeout:
      return "retransmission limit reached";
    case errc::connection_timed_out:
      return "connection timed out";
    case errc::teardown_incomplete:
      return "teardown incomplete";
    case errc::cancelled:
      return "cancelled";
    case errc::transport_error:
      return "transport error";
    case errc::output_failed:
      return "output write failed";
    }
    return "unknown drtp error";
  }
};

} // namespace

const std::error_category &drtp_category() {
  static DrtpCategory cat;
  return cat;
}

} // namespace drtp
