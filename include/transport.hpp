#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace btflash {

// Connected, timeout-bounded byte channel. A read that does not complete
// within the configured timeout fails with std::errc::timed_out.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::error_code send(const uint8_t* data, size_t len) = 0;
    virtual std::error_code receive(uint8_t* data, size_t len) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual std::string describe() const = 0;

    std::error_code send(const std::vector<uint8_t>& data) {
        return send(data.data(), data.size());
    }
};

inline bool is_timeout(const std::error_code& ec) {
    return ec == std::errc::timed_out;
}

} // namespace btflash
