#include "downloader.hpp"
#include "exception.hpp"
#include "fetcher.hpp"
#include "localization.hpp"
#include "url.hpp"
#include "utils.hpp"

#include <charconv>
#include <system_error>

namespace fs = std::filesystem;

std::string_view to_string(CacheDecision decision) {
    switch (decision) {
        case CacheDecision::VerifiedMatch:
            return "verified-match";
        case CacheDecision::WeakMatch:
            return "weak-match";
        case CacheDecision::OfflineFallback:
            return "offline-fallback";
        case CacheDecision::Stale:
            return "stale";
    }
    return "unknown";
}

std::optional<std::uintmax_t> parse_content_length(std::string_view value) {
    value = trim(value);
    if (value.empty()) {
        return std::nullopt;
    }
    std::uintmax_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

CacheDecision decide_cache(const LocalEntry& local, const std::optional<RemoteDescriptor>& remote) {
    if (!remote) {
        return CacheDecision::OfflineFallback;
    }
    if (!remote->sha256.empty() && to_lower(trim(remote->sha256)) == local.sha256) {
        return CacheDecision::VerifiedMatch;
    }
    auto length = parse_content_length(remote->length);
    if (length && *length == local.size) {
        return CacheDecision::WeakMatch;
    }
    return CacheDecision::Stale;
}

Downloader::Downloader(HttpClient& client, Logger& logger, ProgressDisplay& display)
    : client_(client), logger_(logger), display_(display) {}

fs::path Downloader::download(const DownloadRequest& request) {
    const fs::path name = cache_path_for(request.cache_dir, request.url);

    if (auto local = probe_cache(name)) {
        if (validate_cached(*local, request)) {
            return name;
        }
    }

    FetchOptions options;
    options.request.timeout = request.timeout;
    if (request.progress) {
        options.progress = &display_;
    }
    return fetch_file(client_, request.url, name, options, logger_);
}

bool Downloader::validate_cached(const LocalEntry& local, const DownloadRequest& request) {
    logger_.debug(string_format("debug.local_file", local.sha256, local.size));

    RequestOptions options;
    options.timeout = request.timeout;

    std::optional<RemoteDescriptor> remote;
    try {
        remote = probe_remote(client_, request.url, options);
        logger_.debug(string_format("debug.remote_file", remote->sha256, remote->length));
    } catch (const ProbeError& e) {
        logger_.debug(e.what());
    }

    const CacheDecision decision = decide_cache(local, remote);
    logger_.debug(string_format("debug.cache_decision", request.url, to_string(decision)));
    switch (decision) {
        case CacheDecision::OfflineFallback:
            logger_.info(string_format("info.offline_using_cache", request.url));
            return true;
        case CacheDecision::VerifiedMatch:
            logger_.info(string_format("info.hash_match", request.url));
            return true;
        case CacheDecision::WeakMatch:
            logger_.info(string_format("info.length_match", request.url));
            return true;
        case CacheDecision::Stale:
            break;
    }

    logger_.debug(string_format("debug.purging_stale", local.path.string()));
    std::error_code ec;
    fs::remove(local.path, ec);
    if (ec) {
        throw FilesystemError(string_format("error.remove_failed", local.path.string()) + ": " + ec.message());
    }
    return false;
}
