#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace drtp {

bool parse_port(const std::string& s, uint16_t& port);
bool parse_uint(const std::string& s, uint32_t max, uint32_t& out);

// Splits data in order into chunks of chunk_size bytes; the last may be shorter.
std::vector<std::vector<uint8_t>> split_into_chunks(const std::vector<uint8_t>& data,
                                                    size_t chunk_size);
bool read_file_chunks(const std::string& path, size_t chunk_size,
                      std::vector<std::vector<uint8_t>>& chunks, uint64_t& total_bytes);

double throughput_mbps(uint64_t bytes, double seconds);

// "{base, ..., last}" for window logging.
std::string format_window(uint32_t base, uint32_t last);

} // namespace drtp
