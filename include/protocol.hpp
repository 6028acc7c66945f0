#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rkprobe {

constexpr uint16_t kMagic = 0x524B; // 'RK' little-endian
constexpr uint8_t  kVersion = 1;

constexpr size_t kHashLen = 20;
constexpr size_t kZoneIdLen = 64;
constexpr size_t kRequestSize = 2 + kHashLen + kZoneIdLen;   // 86
constexpr size_t kResponseSize = 48;
constexpr size_t kMaxDatagram = 128;

constexpr uint16_t kDefaultHttpPort = 8088;
constexpr uint16_t kFastPortOffset = 1;

static_assert(kRequestSize == 86, "request must be 86 bytes");

enum StateFlags : uint8_t {
    SF_PLAYING = 0x01
};

using ContentHash = std::array<uint8_t, kHashLen>;

// Decoded fast-state reply. Sentinel fields on the wire (seek == -1,
// length == 0) are carried as empty optionals.
struct FastState {
    uint16_t magic{0};
    uint8_t  version{0};
    uint8_t  flags{0};
    ContentHash content_hash{};
    float volume{0.f};
    float volume_min{0.f};
    float volume_max{0.f};
    float volume_step{0.f};
    std::optional<int32_t> seek_position;
    std::optional<uint32_t> length;

    bool playing() const { return (flags & SF_PLAYING) != 0; }
    int32_t raw_seek() const { return seek_position ? *seek_position : -1; }
    uint32_t raw_length() const { return length ? *length : 0; }
};

enum class ProgressStatus : uint8_t {
    Known = 0,
    DurationNotProvided, // length == 0
    SeekNotProvided,     // seek == -1
    SeekInvalid          // other negative seek, nothing to report
};

struct Progress {
    ProgressStatus status{ProgressStatus::DurationNotProvided};
    uint32_t percent{0}; // valid only when status == Known
};

void put_le16(uint8_t* p, uint16_t v);
void put_le32(uint8_t* p, uint32_t v);
void put_le_float(uint8_t* p, float v);
uint16_t get_le16(const uint8_t* p);
uint32_t get_le32(const uint8_t* p);
float get_le_float(const uint8_t* p);

std::vector<uint8_t> build_request(const std::string& zone_id);
std::vector<uint8_t> build_request(const std::string& zone_id, const ContentHash& hash);

// Returns an empty optional when fewer than kResponseSize bytes are given.
std::optional<FastState> decode_response(const uint8_t* data, size_t len);
std::optional<FastState> decode_response(const std::vector<uint8_t>& payload);

Progress compute_progress(const FastState& st);

// True when magic and version match what this probe speaks.
bool validate_response(const FastState& st);

} // namespace rkprobe
