#pragma once

#include "cache_probe.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "remote_probe.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct DownloadRequest {
    std::filesystem::path cache_dir; // must already exist
    std::string url;
    bool progress = false;
    // Applies to the metadata probe and to the transfer separately; zero means no limit.
    std::chrono::milliseconds timeout{0};
};

enum class CacheDecision {
    VerifiedMatch,   // remote checksum equals the local one
    WeakMatch,       // checksum unusable but lengths agree
    OfflineFallback, // remote could not be asked
    Stale,           // purge and fetch again
};

std::string_view to_string(CacheDecision decision);

// Checksum first, then length. remote is std::nullopt when the probe failed.
CacheDecision decide_cache(const LocalEntry& local, const std::optional<RemoteDescriptor>& remote);

// Strict decimal parse of a Content-Length value.
std::optional<std::uintmax_t> parse_content_length(std::string_view value);

// Fetches URLs into a cache directory, reusing cached copies that still match
// the remote and falling back to them when the remote cannot be reached.
// Not safe for concurrent calls on the same cache entry.
class Downloader {
public:
    Downloader(HttpClient& client, Logger& logger, ProgressDisplay& display);

    // Returns the absolute path of the cached file. Throws CfetchException
    // (or a subclass) on failure; a failed fetch leaves no file behind.
    std::filesystem::path download(const DownloadRequest& request);

private:
    // Decides what to do with an existing entry; true when it can be reused.
    bool validate_cached(const LocalEntry& local, const DownloadRequest& request);

    HttpClient& client_;
    Logger& logger_;
    ProgressDisplay& display_;
};
