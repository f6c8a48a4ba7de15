#include "util.hpp"
#include <algorithm>
#include <fstream>

namespace drtp {

bool parse_uint(const std::string &s, uint32_t max, uint32_t &out) {
  if (s.empty() || s.size() > 10)
    return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
    v = v * 10 + (uint64_t)(c - '0');
  }
  if (v > max)
    return false;
  out = (uint32_t)v;
  return true;
}

bool parse_port(const std::string &s, uint16_t &port) {
  uint32_t v = 0;
  if (!parse_uint(s, 65535, v) || v == 0)
    return false;
  port = (uint16_t)v;
  return true;
}

std::vector<std::vector<uint8_t>>
split_into_chunks(const std::vector<uint8_t> &data, size_t chunk_size) {
  std::vector<std::vector<uint8_t>> out;
  if (chunk_size == 0)
    return out;
  out.reserve((data.size() + chunk_size - 1) / chunk_size);
  for (size_t off = 0; off < data.size(); off += chunk_size) {
    size_t n = std::min(chunk_size, data.size() - off);
    out.emplace_back(data.begin() + off, data.begin() + off + n);
  }
  return out;
}

bool read_file_chunks(const std::string &path, size_t chunk_size,
                      std::vector<std::vector<uint8_t>> &chunks,
                      uint64_t &total_bytes) {
  chunks.clear();
  total_bytes = 0;
  if (chunk_size == 0)
    return false;
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;
  std::vector<uint8_t> buf(chunk_size);
  while (in) {
    in.read(reinterpret_cast<char *>(buf.data()), (std::streamsize)chunk_size);
    std::streamsize n = in.gcount();
    if (n <= 0)
      break;
    chunks.emplace_back(buf.begin(), buf.begin() + n);
    total_bytes += (uint64_t)n;
  }
  return !in.bad();
}

double throughput_mbps(uint64_t bytes, double seconds) {
  if (seconds <= 0.0)
    return 0.0;
  return (double)bytes * 8.0 / seconds / 1000000.0;
}

std::string format_window(uint32_t base, uint32_t last) {
  std::string s = "{";
  for (uint32_t i = base; i <= last; ++i) {
    if (i != base)
      s += ", ";
    s += std::to_string(i);
  }
  s += "}";
  return s;
}

} // namespace drtp
