#include "protocol.hpp"
#include <algorithm>

namespace drtp {

static void put_u16(uint8_t *p, uint16_t v) {
  p[0] = (uint8_t)(v >> 8);
  p[1] = (uint8_t)(v & 0xFF);
}

static uint16_t get_u16(const uint8_t *p) {
  return (uint16_t)((p[0] << 8) | p[1]);
}

Packet make_packet(uint16_t seq, uint16_t ack, uint16_t flags,
                   uint16_t recv_window, std::vector<uint8_t> payload) {
  Packet p;
  p.hdr.seq = seq;
  p.hdr.ack = ack;
  p.hdr.flags = flags;
  p.hdr.recv_window = recv_window;
  p.payload = std::move(payload);
  return p;
}

bool encode_packet(const Packet &p, std::vector<uint8_t> &out) {
  if (p.payload.size() > kMaxPayload)
    return false;
  out.resize(kHeaderSize + p.payload.size());
  put_u16(out.data() + 0, p.hdr.seq);
  put_u16(out.data() + 2, p.hdr.ack);
  put_u16(out.data() + 4, p.hdr.flags);
  put_u16(out.data() + 6, p.hdr.recv_window);
  std::copy(p.payload.begin(), p.payload.end(), out.begin() + kHeaderSize);
  return true;
}

std::optional<Packet> decode_packet(const uint8_t *data, size_t len) {
  if (data == nullptr || len < kHeaderSize)
    return std::nullopt;
  Packet p;
  p.hdr.seq = get_u16(data + 0);
  p.hdr.ack = get_u16(data + 2);
  p.hdr.flags = get_u16(data + 4);
  p.hdr.recv_window = get_u16(data + 6);
  p.payload.assign(data + kHeaderSize, data + len);
  return p;
}

std::string describe_flags(uint16_t flags) {
  std::string s;
  auto add = [&s](const char *name) {
    if (!s.empty())
      s += '|';
    s += name;
  };
  if (flags & PF_SYN)
    add("SYN");
  if (flags & PF_FIN)
    add("FIN");
  if (flags & PF_ACK)
    add("ACK");
  if (s.empty())
    s = "DATA";
  return s;
}

} // namespace drtp
