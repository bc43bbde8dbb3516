#pragma once

#include "exception.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_debug(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Redraws a single status line on stdout. Does nothing unless stdout is a TTY.
// A negative percentage draws an empty bar (total size unknown).
void log_progress(const std::string& msg, double percentage, std::string_view suffix, int bar_width = 30);
void end_progress_line();

void set_verbose_mode(bool enable);

// Formatting helpers
std::string format_bytes(double bytes);
std::string format_duration(std::chrono::seconds duration);

// String helpers
std::string to_lower(std::string_view s);
std::string_view trim(std::string_view s);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
