#pragma once

#include "sink.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

struct TransferStats {
    std::uint64_t transferred = 0;
    std::int64_t total = -1; // -1 when the server sent no length
    std::chrono::milliseconds elapsed{0};
    std::optional<std::chrono::seconds> remaining;
    double bytes_per_second = 0.0;
};

// Renders transfer progress. Implementations must not throw from update().
class ProgressDisplay {
public:
    virtual ~ProgressDisplay() = default;

    virtual void start(const std::string& label, std::int64_t total) = 0;
    virtual void update(const TransferStats& stats) = 0;
    virtual void finish(const TransferStats& stats) = 0;
};

// Pass-through decorator: forwards every chunk unchanged to the inner sink and
// reports cumulative statistics to a ProgressDisplay afterwards.
class ProgressSink : public ByteSink {
public:
    ProgressSink(ByteSink& inner, ProgressDisplay& display, std::string label);

    ProgressSink(const ProgressSink&) = delete;
    ProgressSink& operator=(const ProgressSink&) = delete;

    void start(std::int64_t expected_size) override;
    void write(const char* data, std::size_t size) override;
    void finish() override;

    const TransferStats& stats() const { return stats_; }

private:
    void refresh_stats();

    ByteSink& inner_;
    ProgressDisplay& display_;
    std::string label_;
    bool started_ = false;
    std::chrono::steady_clock::time_point start_time_;
    TransferStats stats_;
};

// Single-line bar on stdout, drawn only when stdout is a terminal.
class ConsoleProgressBar : public ProgressDisplay {
public:
    void start(const std::string& label, std::int64_t total) override;
    void update(const TransferStats& stats) override;
    void finish(const TransferStats& stats) override;

private:
    void draw(const TransferStats& stats);

    std::string label_;
    std::chrono::steady_clock::time_point last_draw_;
};
