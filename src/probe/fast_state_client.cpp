#include "fast_state_client.hpp"
#include "logging.hpp"

namespace rkprobe {

namespace {
ExchangeResult fail(ExchangeResult r, const std::string &what) {
  r.status = ExchangeStatus::Error;
  r.error = what;
  Logger::instance().log(LogLevel::ERROR, "%s: %s", what.c_str(),
                         r.ec.message().c_str());
  return r;
}
} // namespace

bool FastStateClient::resolve(const std::string &host, uint16_t port,
                              udp::endpoint &out, std::error_code &ec) {
  auto addr = asio::ip::make_address_v4(host, ec);
  if (!ec) {
    out = udp::endpoint(addr, port);
    return true;
  }
  udp::resolver resolver(io_);
  auto results = resolver.resolve(udp::v4(), host, std::to_string(port), ec);
  if (ec)
    return false;
  if (results.empty()) {
    ec = asio::error::host_not_found;
    return false;
  }
  out = results.begin()->endpoint();
  Logger::instance().log(LogLevel::DEBUG, "resolved %s -> %s", host.c_str(),
                         out.address().to_string().c_str());
  return true;
}

ExchangeResult FastStateClient::send_and_receive(
    const std::string &host, uint16_t port, const std::vector<uint8_t> &request,
    std::chrono::milliseconds timeout, bool broadcast) {
  ExchangeResult r;
  udp::endpoint dest;
  if (!resolve(host, port, dest, r.ec))
    return fail(std::move(r), "resolve " + host);

  udp::socket sock(io_);
  sock.open(udp::v4(), r.ec);
  if (r.ec)
    return fail(std::move(r), "socket open");
  if (broadcast) {
    sock.set_option(asio::socket_base::broadcast(true), r.ec);
    if (r.ec)
      return fail(std::move(r), "enable broadcast");
  }

  std::size_t sent = sock.send_to(asio::buffer(request), dest, 0, r.ec);
  if (r.ec)
    return fail(std::move(r), "sendto");
  if (sent != request.size()) {
    r.ec = asio::error::message_size;
    return fail(std::move(r), "short sendto");
  }
  Logger::instance().log(LogLevel::DEBUG, "sent %zu bytes to %s:%u", sent,
                         dest.address().to_string().c_str(),
                         (unsigned)dest.port());

  std::vector<uint8_t> buf(kMaxDatagram);
  bool done = false;
  std::error_code rec;
  std::size_t n = 0;
  sock.async_receive_from(asio::buffer(buf), r.from,
                          [&](std::error_code ec, std::size_t len) {
                            done = true;
                            rec = ec;
                            n = len;
                          });
  io_.restart();
  io_.run_for(timeout);
  if (!done) {
    // Drain the aborted receive so no handler outlives this frame.
    std::error_code ignored;
    sock.cancel(ignored);
    io_.restart();
    io_.run();
  }

  if (rec == asio::error::operation_aborted) {
    Logger::instance().log(LogLevel::INFO, "no reply within %lld ms",
                           (long long)timeout.count());
    r.status = ExchangeStatus::Timeout;
    return r;
  }
  if (rec) {
    r.ec = rec;
    return fail(std::move(r), "recvfrom");
  }

  buf.resize(n);
  r.payload = std::move(buf);
  r.status = ExchangeStatus::Reply;
  Logger::instance().log(LogLevel::DEBUG, "received %zu bytes from %s:%u", n,
                         r.from.address().to_string().c_str(),
                         (unsigned)r.from.port());
  return r;
}

} // namespace rkprobe
