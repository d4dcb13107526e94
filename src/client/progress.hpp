#pragma once
#include <chrono>
#include <cstddef>
#include <cstdio>

namespace btflash {

class ProgressSink {
public:
    using duration = std::chrono::steady_clock::duration;
    virtual ~ProgressSink() = default;
    virtual void on_progress(size_t completed, size_t total, duration elapsed) = 0;
};

// Single-line bar redrawn in place; a log line breaks it first.
class ConsoleProgress : public ProgressSink {
public:
    explicit ConsoleProgress(FILE* out = stdout);
    ~ConsoleProgress() override;
    void on_progress(size_t completed, size_t total, duration elapsed) override;
    void break_line();
private:
    FILE* out_;
    bool inline_{false};
    int columns() const;
};

} // namespace btflash
