#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "logging.hpp"
#include "protocol.hpp"

namespace rkprobe {

struct ProbeConfig {
    std::string host{"192.168.50.225"};
    uint16_t port{kDefaultHttpPort + kFastPortOffset};
    std::string zone_id;
    double timeout_s{2.0};
    ContentHash hash{};
    bool broadcast{false};
    bool show_help{false};
    LogLevel log_level{LogLevel::WARN};
};

// Positionals are host, port, zone id in that order; options may be mixed in.
// On failure returns false and fills error.
bool parse_probe_args(const std::vector<std::string>& args, ProbeConfig& cfg,
                      std::string& error);

void print_usage(std::ostream& os, const char* prog);

} // namespace rkprobe
