#include "cache_probe.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"

#include <system_error>

namespace fs = std::filesystem;

std::optional<LocalEntry> probe_cache(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return std::nullopt;
    }
    if (ec) {
        throw FilesystemError(string_format("error.stat_failed", path.string()) + ": " + ec.message());
    }
    if (!fs::is_regular_file(status)) {
        throw FilesystemError(string_format("error.not_regular_file", path.string()));
    }

    LocalEntry entry;
    entry.path = path;
    entry.size = fs::file_size(path, ec);
    if (ec) {
        throw FilesystemError(string_format("error.stat_failed", path.string()) + ": " + ec.message());
    }
    entry.sha256 = calculate_sha256(path);
    return entry;
}
