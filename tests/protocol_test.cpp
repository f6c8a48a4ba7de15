#include <gtest/gtest.h>
#include "errors.hpp"
#include "protocol.hpp"

using namespace drtp;

TEST(Protocol, EncodesHeaderBigEndianInFieldOrder) {
  std::vector<uint8_t> out;
  Packet p = make_packet(0x0102, 0x0304, PF_SYN | PF_ACK, 0x0506,
                         {'a', 'b', 'c'});
  ASSERT_TRUE(encode_packet(p, out));
  std::vector<uint8_t> expect = {0x01, 0x02, 0x03, 0x04, 0x00, 0x03,
                                 0x05, 0x06, 'a',  'b',  'c'};
  EXPECT_EQ(out, expect);
}

TEST(Protocol, FlagBitsAreFixed) {
  EXPECT_EQ(PF_ACK, 0x1);
  EXPECT_EQ(PF_SYN, 0x2);
  EXPECT_EQ(PF_FIN, 0x4);
  EXPECT_EQ(kMaxPayload, 992u);
  EXPECT_EQ(kHeaderSize + kMaxPayload, kMaxDatagram);
}

TEST(Protocol, DecodeInvertsEncode) {
  for (size_t len : {size_t(0), size_t(1), size_t(516), kMaxPayload}) {
    std::vector<uint8_t> payload(len);
    for (size_t i = 0; i < len; ++i)
      payload[i] = (uint8_t)(i * 31 + 7);
    Packet p = make_packet(0xFFFF, 0x8000, PF_FIN | PF_ACK, 15, payload);
    std::vector<uint8_t> wire;
    ASSERT_TRUE(encode_packet(p, wire));
    EXPECT_EQ(wire.size(), kHeaderSize + len);

    auto d = decode_packet(wire.data(), wire.size());
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->hdr.seq, 0xFFFF);
    EXPECT_EQ(d->hdr.ack, 0x8000);
    EXPECT_EQ(d->hdr.flags, PF_FIN | PF_ACK);
    EXPECT_EQ(d->hdr.recv_window, 15);
    EXPECT_EQ(d->payload, payload);
  }
}

TEST(Protocol, RejectsOversizedPayload) {
  std::vector<uint8_t> out{1, 2, 3};
  Packet p = make_packet(0, 0, 0, 0, std::vector<uint8_t>(kMaxPayload + 1));
  EXPECT_FALSE(encode_packet(p, out));
  EXPECT_EQ(out.size(), 3u);
}

TEST(Protocol, ShortInputIsMalformed) {
  uint8_t buf[8] = {0, 1, 0, 2, 0, 1, 0, 3};
  for (size_t n = 0; n < kHeaderSize; ++n)
    EXPECT_FALSE(decode_packet(buf, n).has_value()) << "len " << n;
  EXPECT_FALSE(decode_packet(nullptr, 100).has_value());

  auto header_only = decode_packet(buf, 8);
  ASSERT_TRUE(header_only.has_value());
  EXPECT_TRUE(header_only->payload.empty());
  EXPECT_TRUE(header_only->has(PF_ACK));
  EXPECT_EQ(header_only->hdr.recv_window, 3);
}

TEST(Protocol, DecodeDoesNotLimitPayload) {
  std::vector<uint8_t> big(kHeaderSize + 1500, 0xAB);
  auto d = decode_packet(big.data(), big.size());
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->payload.size(), 1500u);
}

TEST(Protocol, FlagHelpers) {
  Packet syn_ack = make_packet(0, 0, PF_SYN | PF_ACK, 15);
  EXPECT_TRUE(syn_ack.has(PF_SYN));
  EXPECT_TRUE(syn_ack.has(PF_SYN | PF_ACK));
  EXPECT_FALSE(syn_ack.has(PF_FIN | PF_ACK));
  EXPECT_FALSE(syn_ack.is_data());
  EXPECT_TRUE(make_packet(3, 0, 0, 5).is_data());

  EXPECT_EQ(describe_flags(0), "DATA");
  EXPECT_EQ(describe_flags(PF_SYN | PF_ACK), "SYN|ACK");
  EXPECT_EQ(describe_flags(PF_FIN | PF_ACK), "FIN|ACK");
}

TEST(Errors, CategoryAndMessages) {
  std::error_code ec = errc::handshake_failed;
  EXPECT_EQ(std::string(ec.category().name()), "drtp");
  EXPECT_EQ(ec.message(), "handshake failed");
  EXPECT_TRUE(ec == errc::handshake_failed);
  EXPECT_FALSE(ec == errc::teardown_incomplete);
  EXPECT_EQ(make_error_code(errc::connection_timed_out).message(),
            "connection timed out");
}
