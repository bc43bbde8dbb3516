#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// What is known about a file already sitting in the cache.
struct LocalEntry {
    std::filesystem::path path;
    std::uintmax_t size = 0;
    std::string sha256;
};

// Returns std::nullopt when nothing exists at path. Throws FilesystemError for
// any other stat failure or a non-regular file, HashError when hashing fails.
std::optional<LocalEntry> probe_cache(const std::filesystem::path& path);
