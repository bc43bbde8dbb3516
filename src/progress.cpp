#include "progress.hpp"
#include "utils.hpp"

#include <sstream>
#include <utility>

ProgressSink::ProgressSink(ByteSink& inner, ProgressDisplay& display, std::string label)
    : inner_(inner), display_(display), label_(std::move(label)) {}

void ProgressSink::start(std::int64_t expected_size) {
    inner_.start(expected_size);
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();
    stats_ = TransferStats{};
    stats_.total = expected_size;
    display_.start(label_, expected_size);
}

void ProgressSink::write(const char* data, std::size_t size) {
    if (!started_) {
        start(-1);
    }
    inner_.write(data, size);
    stats_.transferred += size;
    refresh_stats();
    display_.update(stats_);
}

void ProgressSink::finish() {
    if (!started_) {
        // Empty body: the transport never announced a start.
        start(0);
    }
    inner_.finish();
    refresh_stats();
    display_.finish(stats_);
}

void ProgressSink::refresh_stats() {
    using namespace std::chrono;
    stats_.elapsed = duration_cast<milliseconds>(steady_clock::now() - start_time_);

    const double seconds = duration<double>(stats_.elapsed).count();
    stats_.bytes_per_second = seconds > 0.0 ? static_cast<double>(stats_.transferred) / seconds : 0.0;

    stats_.remaining.reset();
    if (stats_.total >= 0 && stats_.bytes_per_second > 0.0) {
        const auto total = static_cast<std::uint64_t>(stats_.total);
        const double left = total > stats_.transferred ? static_cast<double>(total - stats_.transferred) : 0.0;
        stats_.remaining = std::chrono::seconds(static_cast<long long>(left / stats_.bytes_per_second + 0.5));
    }
}

void ConsoleProgressBar::start(const std::string& label, std::int64_t total) {
    label_ = label;
    last_draw_ = {};
    TransferStats initial;
    initial.total = total;
    draw(initial);
}

void ConsoleProgressBar::update(const TransferStats& stats) {
    auto now = std::chrono::steady_clock::now();
    if (now - last_draw_ < std::chrono::milliseconds(100)) {
        return;
    }
    draw(stats);
}

void ConsoleProgressBar::finish(const TransferStats& stats) {
    draw(stats);
    end_progress_line();
}

void ConsoleProgressBar::draw(const TransferStats& stats) {
    last_draw_ = std::chrono::steady_clock::now();

    std::ostringstream suffix;
    suffix << format_bytes(static_cast<double>(stats.transferred));
    if (stats.total >= 0) {
        suffix << " / " << format_bytes(static_cast<double>(stats.total));
    }
    suffix << "  " << format_bytes(stats.bytes_per_second) << "/s";
    if (stats.remaining) {
        suffix << "  ETA " << format_duration(*stats.remaining);
    }

    double percentage = -1.0;
    if (stats.total > 0) {
        percentage = static_cast<double>(stats.transferred) / static_cast<double>(stats.total) * 100.0;
    } else if (stats.total == 0) {
        percentage = 100.0;
    }
    log_progress(label_, percentage, suffix.str());
}
