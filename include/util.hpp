
#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace tilecast {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
bool parse_uint(const std::string& s, uint64_t max, uint64_t& out);
// Reduces an untrusted name to one safe path component ("_" for nothing usable).
std::string sanitize_component(const std::string& s);
bool read_file(const std::string& path, std::vector<uint8_t>& out);

} // namespace tilecast
