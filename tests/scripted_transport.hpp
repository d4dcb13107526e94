#pragma once
#include <deque>
#include <memory>
#include <optional>
#include <vector>
#include "transport.hpp"

namespace btflash {
namespace testing {

// One scripted answer to a receive() call.
struct Reply {
    std::optional<uint8_t> byte;   // nullopt: the read times out
    std::error_code error{};       // non-timeout link failure

    static Reply of(uint8_t b) { return Reply{b, {}}; }
    static Reply timeout() { return Reply{std::nullopt, {}}; }
    static Reply broken() {
        return Reply{std::nullopt, std::make_error_code(std::errc::connection_reset)};
    }
};

// Outlives the transport so tests can inspect it after the session drops it.
struct Script {
    std::deque<Reply> replies;
    std::optional<Reply> fallback;   // used once `replies` runs dry
    std::vector<std::vector<uint8_t>> sent;
    size_t receives{0};
    bool closed{false};

    size_t count_sent(const std::vector<uint8_t>& msg) const {
        size_t n = 0;
        for (const auto& s : sent)
            if (s == msg)
                n++;
        return n;
    }
};

class ScriptedTransport : public Transport {
public:
    explicit ScriptedTransport(std::shared_ptr<Script> s) : s_(std::move(s)) {}
    ~ScriptedTransport() override { close(); }

    std::error_code send(const uint8_t* data, size_t len) override {
        s_->sent.emplace_back(data, data + len);
        return {};
    }
    std::error_code receive(uint8_t* data, size_t len) override {
        s_->receives++;
        Reply r = Reply::timeout();
        if (!s_->replies.empty()) {
            r = s_->replies.front();
            s_->replies.pop_front();
        } else if (s_->fallback) {
            r = *s_->fallback;
        }
        if (r.error)
            return r.error;
        if (!r.byte)
            return std::make_error_code(std::errc::timed_out);
        for (size_t i = 0; i < len; i++)
            data[i] = *r.byte;
        return {};
    }
    void close() override { s_->closed = true; }
    bool is_open() const override { return !s_->closed; }
    std::string describe() const override { return "scripted"; }
    using Transport::send;
private:
    std::shared_ptr<Script> s_;
};

} // namespace testing
} // namespace btflash
