#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace rkprobe {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// "http://host:8088/..." -> host and the fast-state UDP port (HTTP port + 1).
// A URL without a port uses the default bridge HTTP port.
bool parse_bridge_url(const std::string& url, std::string& host, uint16_t& udp_port);

constexpr double kMaxTimeoutSeconds = 3600.0;

bool parse_port(const std::string& s, uint16_t& port);
// Accepts 0 < seconds <= kMaxTimeoutSeconds.
bool parse_timeout(const std::string& s, double& seconds);

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& data);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);

} // namespace rkprobe
