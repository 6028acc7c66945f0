#include "probe_options.hpp"
#include "util.hpp"
#include "logging.hpp"
#include <cstring>

namespace rkprobe {

static const char *kBroadcastAddr = "255.255.255.255";

bool parse_probe_args(const std::vector<std::string> &args, ProbeConfig &cfg,
                      std::string &error) {
  size_t positional = 0;
  bool only_positional = false;

  for (size_t i = 0; i < args.size(); i++) {
    const std::string &a = args[i];
    auto next = [&](size_t &i, std::string &out) -> bool {
      if (i + 1 < args.size()) {
        out = args[++i];
        return true;
      }
      error = "missing value for " + a;
      return false;
    };

    if (!only_positional && a.size() > 1 && a[0] == '-') {
      std::string v;
      if (a == "--") {
        only_positional = true;
      } else if (a == "-h" || a == "--help") {
        cfg.show_help = true;
      } else if (a == "-v" || a == "--verbose") {
        cfg.log_level = LogLevel::DEBUG;
      } else if (a == "--log-level") {
        if (!next(i, v))
          return false;
        if (!log_level_from_string(v, cfg.log_level)) {
          error = "bad log level: " + v;
          return false;
        }
      } else if (a == "--timeout") {
        if (!next(i, v))
          return false;
        if (!parse_timeout(v, cfg.timeout_s)) {
          error = "bad timeout: " + v;
          return false;
        }
      } else if (a == "--hash") {
        if (!next(i, v))
          return false;
        auto bytes = hex_to_bytes(v);
        if (bytes.size() != kHashLen) {
          error = "hash must be 40 hex digits";
          return false;
        }
        std::memcpy(cfg.hash.data(), bytes.data(), kHashLen);
      } else if (a == "--bridge") {
        if (!next(i, v))
          return false;
        if (!parse_bridge_url(v, cfg.host, cfg.port)) {
          error = "bad bridge url: " + v;
          return false;
        }
      } else if (a == "--broadcast") {
        cfg.broadcast = true;
      } else {
        error = "unknown option: " + a;
        return false;
      }
      continue;
    }

    switch (positional++) {
    case 0:
      cfg.host = a;
      break;
    case 1:
      if (!parse_port(a, cfg.port)) {
        error = "bad port: " + a;
        return false;
      }
      break;
    case 2:
      cfg.zone_id = a;
      break;
    default:
      error = "unexpected argument: " + a;
      return false;
    }
  }

  if (cfg.broadcast) {
    if (positional > 0 && cfg.host != kBroadcastAddr)
      Logger::instance().log(LogLevel::WARN,
                             "--broadcast ignores host %s", cfg.host.c_str());
    if (!cfg.zone_id.empty())
      Logger::instance().log(LogLevel::WARN, "--broadcast ignores zone '%s'",
                             cfg.zone_id.c_str());
    cfg.host = kBroadcastAddr;
    cfg.zone_id.clear();
    cfg.hash.fill(0);
  }
  return true;
}

void print_usage(std::ostream &os, const char *prog) {
  os << "usage: " << prog << " [options] [host] [port] [zone_id]\n"
     << "\n"
     << "Send one fast-state poll to a bridge and print the reply.\n"
     << "\n"
     << "  host               bridge address (default 192.168.50.225)\n"
     << "  port               bridge UDP port (default 8089)\n"
     << "  zone_id            zone to query (default empty)\n"
     << "\n"
     << "  --timeout SEC      receive timeout in seconds (default 2.0)\n"
     << "  --hash HEX         40 hex digit content hash to send\n"
     << "  --bridge URL       bridge base URL, UDP port is URL port + 1\n"
     << "  --broadcast        discover a bridge on the local network\n"
     << "  --log-level LEVEL  trace|debug|info|warn|error (default warn)\n"
     << "  -v, --verbose      same as --log-level debug\n"
     << "  -h, --help         show this text\n";
}

} // namespace rkprobe
