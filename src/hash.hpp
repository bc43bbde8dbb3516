#pragma once

#include <filesystem>
#include <string>

// Calculates the SHA256 hash of a file as lowercase hex, without any "sha256:" prefix.
// Throws HashError if the file cannot be read or OpenSSL fails.
std::string calculate_sha256(const std::filesystem::path& file_path);
