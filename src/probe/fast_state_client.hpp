#pragma once
#include <asio.hpp>
#include <chrono>
#include <string>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace rkprobe {

enum class ExchangeStatus : uint8_t { Reply = 0, Timeout, Error };

struct ExchangeResult {
    ExchangeStatus status{ExchangeStatus::Error};
    std::vector<uint8_t> payload;
    asio::ip::udp::endpoint from;
    std::error_code ec;
    std::string error; // what was being attempted when ec was set
};

// One request datagram, at most one reply. The socket lives only for the
// duration of send_and_receive().
class FastStateClient {
public:
    using udp = asio::ip::udp;
    explicit FastStateClient(asio::io_context& io) : io_(io) {}

    ExchangeResult send_and_receive(const std::string& host, uint16_t port,
                                    const std::vector<uint8_t>& request,
                                    std::chrono::milliseconds timeout,
                                    bool broadcast = false);

private:
    bool resolve(const std::string& host, uint16_t port, udp::endpoint& out,
                 std::error_code& ec);

    asio::io_context& io_;
};

} // namespace rkprobe
