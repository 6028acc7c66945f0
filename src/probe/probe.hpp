#pragma once
#include <ostream>
#include "fast_state_client.hpp"
#include "probe_options.hpp"

namespace rkprobe {

void print_state(std::ostream& os, const FastState& st);

// Renders one exchange outcome. Returns the process exit status:
// 0 for reply, malformed reply and timeout, 1 for transport errors.
int report_exchange(std::ostream& os, const ExchangeResult& res, bool broadcast);

// Builds the request, performs the exchange and reports it to os.
int run_probe(const ProbeConfig& cfg, std::ostream& os);

} // namespace rkprobe
