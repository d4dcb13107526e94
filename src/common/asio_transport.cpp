#include "asio_transport.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace btflash {

namespace {

// Runs one async operation on `io` for at most `timeout`. Whatever is still
// pending at the deadline is cancelled and reported as timed_out.
template <typename Start, typename Cancel>
std::error_code run_with_deadline(asio::io_context &io,
                                  std::chrono::milliseconds timeout,
                                  Start start, Cancel cancel) {
  std::error_code result = asio::error::would_block;
  start([&result](std::error_code ec, auto &&...) { result = ec; });
  io.restart();
  io.run_for(timeout);
  if (!io.stopped()) {
    cancel();
    io.run();
  }
  if (result == asio::error::would_block ||
      result == asio::error::operation_aborted)
    return std::make_error_code(std::errc::timed_out);
  return result;
}

} // namespace

SerialTransport::SerialTransport(std::chrono::milliseconds timeout,
                                 unsigned baud)
    : port_(io_), timeout_(timeout), baud_(baud) {}

SerialTransport::~SerialTransport() { close(); }

std::error_code SerialTransport::open(const std::string &device) {
  std::error_code ec;
  port_.open(device, ec);
  if (ec)
    return ec;
  device_ = device;
  using sp = asio::serial_port_base;
  port_.set_option(sp::baud_rate(baud_), ec);
  if (!ec)
    port_.set_option(sp::character_size(8), ec);
  if (!ec)
    port_.set_option(sp::parity(sp::parity::none), ec);
  if (!ec)
    port_.set_option(sp::stop_bits(sp::stop_bits::one), ec);
  if (!ec)
    port_.set_option(sp::flow_control(sp::flow_control::none), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "%s: cannot configure port: %s",
                           device.c_str(), ec.message().c_str());
    close();
    return ec;
  }
  Logger::instance().log(LogLevel::DEBUG, "opened %s at %u baud",
                         device.c_str(), baud_);
  return {};
}

std::error_code SerialTransport::send(const uint8_t *data, size_t len) {
  return run_with_deadline(
      io_, timeout_,
      [&](auto handler) {
        asio::async_write(port_, asio::buffer(data, len), handler);
      },
      [this] {
        std::error_code ignored;
        port_.cancel(ignored);
      });
}

std::error_code SerialTransport::receive(uint8_t *data, size_t len) {
  return run_with_deadline(
      io_, timeout_,
      [&](auto handler) {
        asio::async_read(port_, asio::buffer(data, len), handler);
      },
      [this] {
        std::error_code ignored;
        port_.cancel(ignored);
      });
}

void SerialTransport::close() {
  if (!port_.is_open())
    return;
  std::error_code ec;
  port_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "%s: close failed: %s",
                           device_.c_str(), ec.message().c_str());
  else
    Logger::instance().log(LogLevel::DEBUG, "closed %s", device_.c_str());
}

TcpTransport::TcpTransport(std::chrono::milliseconds timeout)
    : sock_(io_), timeout_(timeout) {}

TcpTransport::~TcpTransport() { close(); }

std::error_code TcpTransport::connect(const std::string &host,
                                      uint16_t port) {
  std::error_code ec;
  tcp::resolver res(io_);
  auto results = res.resolve(host, std::to_string(port), ec);
  if (ec)
    return ec;
  ec = run_with_deadline(
      io_, timeout_,
      [&](auto handler) { asio::async_connect(sock_, results, handler); },
      [this] {
        std::error_code ignored;
        sock_.close(ignored);
      });
  if (ec) {
    std::error_code ignored;
    sock_.close(ignored);
    return ec;
  }
  sock_.set_option(tcp::no_delay(true), ec);
  if (ec)
    Logger::instance().log(LogLevel::DEBUG, "no_delay not applied: %s",
                           ec.message().c_str());
  peer_ = host + ":" + std::to_string(port);
  Logger::instance().log(LogLevel::DEBUG, "connected to %s", peer_.c_str());
  return {};
}

std::error_code TcpTransport::send(const uint8_t *data, size_t len) {
  return run_with_deadline(
      io_, timeout_,
      [&](auto handler) {
        asio::async_write(sock_, asio::buffer(data, len), handler);
      },
      [this] {
        std::error_code ignored;
        sock_.cancel(ignored);
      });
}

std::error_code TcpTransport::receive(uint8_t *data, size_t len) {
  return run_with_deadline(
      io_, timeout_,
      [&](auto handler) {
        asio::async_read(sock_, asio::buffer(data, len), handler);
      },
      [this] {
        std::error_code ignored;
        sock_.cancel(ignored);
      });
}

void TcpTransport::close() {
  if (!sock_.is_open())
    return;
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  sock_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "%s: close failed: %s",
                           peer_.c_str(), ec.message().c_str());
  else
    Logger::instance().log(LogLevel::DEBUG, "closed %s", peer_.c_str());
}

std::unique_ptr<Transport> open_transport(const std::string &target,
                                          std::chrono::milliseconds timeout,
                                          unsigned baud, std::error_code &ec) {
  if (!target.empty() && target[0] == '/') {
    auto t = std::make_unique<SerialTransport>(timeout, baud);
    ec = t->open(target);
    if (ec)
      return nullptr;
    return t;
  }
  std::string host;
  uint16_t port;
  if (!parse_host_port(target, host, port)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return nullptr;
  }
  auto t = std::make_unique<TcpTransport>(timeout);
  ec = t->connect(host, port);
  if (ec)
    return nullptr;
  return t;
}

} // namespace btflash
