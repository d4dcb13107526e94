#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include "transport.hpp"

namespace btflash {

// Link device exposed as a tty, e.g. /dev/rfcomm0.
class SerialTransport : public Transport {
public:
    SerialTransport(std::chrono::milliseconds timeout, unsigned baud);
    ~SerialTransport() override;
    std::error_code open(const std::string& device);
    std::error_code send(const uint8_t* data, size_t len) override;
    std::error_code receive(uint8_t* data, size_t len) override;
    void close() override;
    bool is_open() const override { return port_.is_open(); }
    std::string describe() const override { return device_; }
    using Transport::send;
private:
    asio::io_context io_;
    asio::serial_port port_;
    std::chrono::milliseconds timeout_;
    unsigned baud_;
    std::string device_;
};

// Byte stream bridged over TCP.
class TcpTransport : public Transport {
public:
    using tcp = asio::ip::tcp;
    explicit TcpTransport(std::chrono::milliseconds timeout);
    ~TcpTransport() override;
    std::error_code connect(const std::string& host, uint16_t port);
    std::error_code send(const uint8_t* data, size_t len) override;
    std::error_code receive(uint8_t* data, size_t len) override;
    void close() override;
    bool is_open() const override { return sock_.is_open(); }
    std::string describe() const override { return peer_; }
    using Transport::send;
private:
    asio::io_context io_;
    tcp::socket sock_;
    std::chrono::milliseconds timeout_;
    std::string peer_;
};

// `target` is either a device path or host:port.
std::unique_ptr<Transport> open_transport(const std::string& target,
                                          std::chrono::milliseconds timeout,
                                          unsigned baud, std::error_code& ec);

} // namespace btflash
