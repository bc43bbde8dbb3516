#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace {
    fs::path env_path(const char* name) {
        const char* value = std::getenv(name);
        if (value && *value) {
            return fs::path(value);
        }
        return {};
    }

    [[noreturn]] void config_error(const fs::path& file, int line_no, const std::string& detail) {
        throw CfetchException(string_format("error.config_invalid", file.string(), line_no, detail));
    }
}

fs::path default_config_file() {
    if (fs::path xdg = env_path("XDG_CONFIG_HOME"); !xdg.empty()) {
        return xdg / "cfetch" / "cfetch.conf";
    }
    if (fs::path home = env_path("HOME"); !home.empty()) {
        return home / ".config" / "cfetch" / "cfetch.conf";
    }
    return {};
}

fs::path default_cache_dir() {
    if (fs::path xdg = env_path("XDG_CACHE_HOME"); !xdg.empty()) {
        return xdg / "cfetch";
    }
    if (fs::path home = env_path("HOME"); !home.empty()) {
        return home / ".cache" / "cfetch";
    }
    return fs::path("/tmp") / ("cfetch_" + std::to_string(geteuid()));
}

bool is_valid_timeout(long long seconds) {
    return seconds >= 0 && seconds <= std::chrono::milliseconds::max().count() / 1000;
}

std::optional<bool> parse_bool(const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

Settings load_settings(const fs::path& config_file) {
    Settings settings;
    settings.cache_dir = default_cache_dir();

    if (config_file.empty() || !fs::exists(config_file)) {
        return settings;
    }

    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw FilesystemError(string_format("error.open_file_failed", config_file.string()));
    }

    std::string raw;
    int line_no = 0;
    while (std::getline(file, raw)) {
        ++line_no;
        std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#') continue;

        size_t pos = line.find('=');
        if (pos == std::string_view::npos) {
            config_error(config_file, line_no, get_string("error.config_missing_equals"));
        }
        const std::string key = to_lower(trim(line.substr(0, pos)));
        const std::string value(trim(line.substr(pos + 1)));

        if (key == "cache_dir") {
            if (value.empty()) {
                config_error(config_file, line_no, string_format("error.config_bad_value", key, value));
            }
            settings.cache_dir = value;
        } else if (key == "progress" || key == "verbose") {
            auto flag = parse_bool(value);
            if (!flag) {
                config_error(config_file, line_no, string_format("error.config_bad_value", key, value));
            }
            (key == "progress" ? settings.progress : settings.verbose) = *flag;
        } else if (key == "timeout") {
            long long seconds = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
            if (ec != std::errc() || ptr != value.data() + value.size() || !is_valid_timeout(seconds)) {
                config_error(config_file, line_no, string_format("error.config_bad_value", key, value));
            }
            settings.timeout = std::chrono::seconds(seconds);
        } else {
            config_error(config_file, line_no, string_format("error.config_unknown_key", key));
        }
    }
    return settings;
}
