#include "utils.hpp"

#include "localization.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <system_error>

namespace {
    bool verbose_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_line_open = false;

    // Caller must hold log_mutex.
    void check_ttys() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    // Caller must hold log_mutex.
    void close_progress_line() {
        if (progress_line_open) {
            std::cout << std::endl;
            progress_line_open = false;
        }
    }

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_ttys();
        close_progress_line();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_debug(std::string_view msg) {
    if (!verbose_mode) {
        return;
    }
    log_internal(get_string("debug.prefix") + " ", COLOR_BLUE, msg, std::cerr);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, std::string_view suffix, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_ttys();
    if (!is_stdout_tty) {
        return;
    }

    int pos = percentage < 0 ? -1 : static_cast<int>(bar_width * std::min(percentage, 100.0) / 100.0);

    std::cout << "\r" << COLOR_GREEN << get_string("info.log_prefix") << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] ";
    if (percentage >= 0) {
        std::cout << std::fixed << std::setprecision(1) << std::min(percentage, 100.0) << "% ";
    }
    std::cout << suffix << "\033[K" << COLOR_RESET << std::flush;
    progress_line_open = true;
}

void end_progress_line() {
    std::lock_guard<std::mutex> lock(log_mutex);
    close_progress_line();
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

std::string format_bytes(double bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    size_t unit = 0;
    while (bytes >= 1024.0 && unit < std::size(units) - 1) {
        bytes /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    if (unit == 0) {
        ss << static_cast<long long>(bytes) << " " << units[unit];
    } else {
        ss << std::fixed << std::setprecision(1) << bytes << " " << units[unit];
    }
    return ss.str();
}

std::string format_duration(std::chrono::seconds duration) {
    long long total = std::max<long long>(duration.count(), 0);
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream ss;
    ss << std::setfill('0');
    if (hours > 0) {
        ss << hours << ":" << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    } else {
        ss << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    }
    return ss.str();
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw FilesystemError(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw FilesystemError(string_format("error.path_not_dir", path.string()));
    }
}
