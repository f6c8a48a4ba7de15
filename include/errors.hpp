#pragma once
#include <system_error>

namespace drtp {

enum class errc {
    malformed_packet = 1,
    handshake_failed,
    retransmit_timeout,
    connection_timed_out,
    teardown_incomplete,
    cancelled,
    transport_error,
    output_failed
};

const std::error_category& drtp_category();

inline std::error_code make_error_code(errc e) {
    return std::error_code(static_cast<int>(e), drtp_category());
}

} // namespace drtp

namespace std {
template <> struct is_error_code_enum<drtp::errc> : true_type {};
} // namespace std
