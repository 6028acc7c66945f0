#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace rkprobe {

namespace {
constexpr size_t kOffMagic = 0;
constexpr size_t kOffVersion = 2;
constexpr size_t kOffFlags = 3;
constexpr size_t kOffHash = 4;
constexpr size_t kOffVolume = 24;
constexpr size_t kOffVolumeMin = 28;
constexpr size_t kOffVolumeMax = 32;
constexpr size_t kOffVolumeStep = 36;
constexpr size_t kOffSeek = 40;
constexpr size_t kOffLength = 44;

constexpr size_t kReqOffHash = 2;
constexpr size_t kReqOffZone = kReqOffHash + kHashLen;
} // namespace

void put_le16(uint8_t *p, uint16_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)(v >> 8);
}

void put_le32(uint8_t *p, uint32_t v) {
  for (int i = 0; i < 4; i++)
    p[i] = (uint8_t)(v >> (8 * i));
}

void put_le_float(uint8_t *p, float v) {
  uint32_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  put_le32(p, bits);
}

uint16_t get_le16(const uint8_t *p) {
  return (uint16_t)(p[0] | ((uint16_t)p[1] << 8));
}

uint32_t get_le32(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

float get_le_float(const uint8_t *p) {
  uint32_t bits = get_le32(p);
  float v;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

std::vector<uint8_t> build_request(const std::string &zone_id) {
  return build_request(zone_id, ContentHash{});
}

std::vector<uint8_t> build_request(const std::string &zone_id,
                                   const ContentHash &hash) {
  std::vector<uint8_t> req(kRequestSize, 0);
  put_le16(req.data(), kMagic);
  std::memcpy(req.data() + kReqOffHash, hash.data(), kHashLen);
  // Byte-wise truncation; a multi-byte code point may be cut.
  size_t n = std::min(zone_id.size(), kZoneIdLen);
  if (n)
    std::memcpy(req.data() + kReqOffZone, zone_id.data(), n);
  return req;
}

std::optional<FastState> decode_response(const uint8_t *data, size_t len) {
  if (!data || len < kResponseSize)
    return std::nullopt;
  FastState st;
  st.magic = get_le16(data + kOffMagic);
  st.version = data[kOffVersion];
  st.flags = data[kOffFlags];
  std::memcpy(st.content_hash.data(), data + kOffHash, kHashLen);
  st.volume = get_le_float(data + kOffVolume);
  st.volume_min = get_le_float(data + kOffVolumeMin);
  st.volume_max = get_le_float(data + kOffVolumeMax);
  st.volume_step = get_le_float(data + kOffVolumeStep);

  int32_t seek = (int32_t)get_le32(data + kOffSeek);
  if (seek != -1)
    st.seek_position = seek;
  uint32_t length = get_le32(data + kOffLength);
  if (length != 0)
    st.length = length;
  return st;
}

std::optional<FastState> decode_response(const std::vector<uint8_t> &payload) {
  return decode_response(payload.data(), payload.size());
}

Progress compute_progress(const FastState &st) {
  Progress p;
  if (!st.length) {
    p.status = ProgressStatus::DurationNotProvided;
    return p;
  }
  if (!st.seek_position) {
    p.status = ProgressStatus::SeekNotProvided;
    return p;
  }
  if (*st.seek_position < 0) {
    p.status = ProgressStatus::SeekInvalid;
    return p;
  }
  p.status = ProgressStatus::Known;
  p.percent = (uint32_t)((uint64_t)*st.seek_position * 100 / *st.length);
  return p;
}

bool validate_response(const FastState &st) {
  return st.magic == kMagic && st.version == kVersion;
}

} // namespace rkprobe
