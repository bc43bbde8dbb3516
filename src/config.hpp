#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

struct Settings {
    std::filesystem::path cache_dir;
    bool progress = false;
    std::chrono::seconds timeout{0};
    bool verbose = false;
};

// $XDG_CONFIG_HOME/cfetch/cfetch.conf, else ~/.config/cfetch/cfetch.conf.
// Empty when neither variable is set.
std::filesystem::path default_config_file();

// $XDG_CACHE_HOME/cfetch, else ~/.cache/cfetch, else /tmp/cfetch_<uid>.
std::filesystem::path default_cache_dir();

// Reads "key = value" lines on top of the defaults. A missing file yields the
// defaults; malformed lines, unknown keys and bad values throw CfetchException.
Settings load_settings(const std::filesystem::path& config_file);

// Timeouts are handed to the transport in milliseconds; anything negative or
// beyond what std::chrono::milliseconds can hold is rejected.
bool is_valid_timeout(long long seconds);

// Accepts true/false, yes/no, on/off, 1/0 in any letter case.
std::optional<bool> parse_bool(const std::string& value);
