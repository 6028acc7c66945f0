#include "util.hpp"
#include "protocol.hpp"
#include <cmath>
#include <sodium.h>
#include <stdexcept>

namespace rkprobe {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  if (host.empty())
    return false;
  return parse_port(s.substr(pos + 1), port);
}

bool parse_bridge_url(const std::string &url, std::string &host,
                      uint16_t &udp_port) {
  std::string hp = url;
  auto scheme = hp.find("://");
  if (scheme != std::string::npos)
    hp = hp.substr(scheme + 3);
  auto slash = hp.find('/');
  if (slash != std::string::npos)
    hp = hp.substr(0, slash);
  if (hp.empty())
    return false;

  uint16_t http_port = kDefaultHttpPort;
  if (hp.find(':') != std::string::npos) {
    if (!parse_host_port(hp, host, http_port))
      return false;
  } else {
    host = hp;
  }
  if (http_port > 65535 - kFastPortOffset)
    return false;
  udp_port = (uint16_t)(http_port + kFastPortOffset);
  return true;
}

bool parse_port(const std::string &s, uint16_t &port) {
  try {
    size_t used = 0;
    int p = std::stoi(s, &used);
    if (used != s.size() || p <= 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_timeout(const std::string &s, double &seconds) {
  try {
    size_t used = 0;
    double v = std::stod(s, &used);
    if (used != s.size() || !std::isfinite(v) || v <= 0.0 ||
        v > kMaxTimeoutSeconds)
      return false;
    seconds = v;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string to_hex(const uint8_t *data, size_t len) {
  if (!data || len == 0)
    return std::string();
  std::string out(len * 2 + 1, '\0');
  sodium_bin2hex(&out[0], out.size(), data, len);
  out.resize(len * 2);
  return out;
}

std::string to_hex(const std::vector<uint8_t> &data) {
  return to_hex(data.data(), data.size());
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.resize(hex.size() / 2);
  size_t bin_len = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr,
                     &bin_len, &end) != 0 ||
      end != hex.data() + hex.size() || bin_len != out.size()) {
    out.clear();
  }
  return out;
}

} // namespace rkprobe
