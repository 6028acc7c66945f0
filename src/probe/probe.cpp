#include "probe.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>

namespace rkprobe {

void print_state(std::ostream &os, const FastState &st) {
  std::ios_base::fmtflags saved = os.flags();
  std::streamsize saved_prec = os.precision();
  os << "  magic=0x" << std::hex << std::uppercase << std::setfill('0')
     << std::setw(4) << st.magic << std::dec << " ver=" << (unsigned)st.version
     << " flags=0x" << std::hex << std::setw(2) << (unsigned)st.flags
     << std::dec << std::setfill(' ') << "\n";
  os.flags(saved);
  os << "  sha=" << to_hex(st.content_hash.data(), 8) << "\n";
  os << std::fixed << std::setprecision(1) << "  volume=" << st.volume
     << " min=" << st.volume_min << " max=" << st.volume_max
     << " step=" << st.volume_step << "\n";
  os.flags(saved);
  os.precision(saved_prec);
  os << "  seek_position=" << st.raw_seek() << " length=" << st.raw_length()
     << "\n";
  os << "  playing=" << (st.playing() ? "true" : "false") << "\n";

  Progress p = compute_progress(st);
  switch (p.status) {
  case ProgressStatus::Known:
    os << "  progress=" << p.percent << "%\n";
    break;
  case ProgressStatus::DurationNotProvided:
    os << "  warning: length=0, bridge not sending duration\n";
    break;
  case ProgressStatus::SeekNotProvided:
    os << "  warning: seek=-1, bridge not sending seek position\n";
    break;
  case ProgressStatus::SeekInvalid:
    break;
  }
}

int report_exchange(std::ostream &os, const ExchangeResult &res,
                    bool broadcast) {
  switch (res.status) {
  case ExchangeStatus::Timeout:
    os << "No response (timeout)\n";
    return 0;
  case ExchangeStatus::Error:
    os << "Probe failed: " << res.error << ": " << res.ec.message() << "\n";
    return 1;
  case ExchangeStatus::Reply:
    break;
  }

  std::string from =
      res.from.address().to_string() + ":" + std::to_string(res.from.port());
  os << "Got " << res.payload.size() << " bytes from " << from << "\n";

  auto st = decode_response(res.payload);
  if (!st) {
    Logger::instance().log(LogLevel::WARN, "short reply (%zu bytes)",
                           res.payload.size());
    os << "  Unexpected size: " << to_hex(res.payload) << "\n";
    return 0;
  }
  print_state(os, *st);

  if (!validate_response(*st)) {
    Logger::instance().log(LogLevel::WARN, "bad magic=0x%04X or version=%d",
                           st->magic, st->version);
    os << "  warning: unexpected magic or version\n";
  } else if (broadcast) {
    os << "Bridge discovered at " << res.from.address().to_string() << "\n";
  }
  return 0;
}

int run_probe(const ProbeConfig &cfg, std::ostream &os) {
  auto req = build_request(cfg.zone_id, cfg.hash);
  Logger::instance().log(LogLevel::INFO, "polling %s:%u zone='%s'",
                         cfg.host.c_str(), (unsigned)cfg.port,
                         cfg.zone_id.c_str());

  double secs = std::min(std::max(cfg.timeout_s, 0.001), kMaxTimeoutSeconds);
  auto timeout = std::chrono::milliseconds(std::llround(secs * 1000.0));
  asio::io_context io;
  FastStateClient client(io);
  auto res = client.send_and_receive(cfg.host, cfg.port, req, timeout,
                                     cfg.broadcast);
  return report_exchange(os, res, cfg.broadcast);
}

} // namespace rkprobe
