#pragma once

#include "http_client.hpp"
#include "logger.hpp"
#include "progress.hpp"

#include <filesystem>
#include <string>

struct FetchOptions {
    RequestOptions request;
    // Progress is reported only when this is set.
    ProgressDisplay* progress = nullptr;
};

// Removes a file on scope exit unless commit() was called.
class PartialFileGuard {
public:
    explicit PartialFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~PartialFileGuard();

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    void commit() { committed_ = true; }

private:
    std::filesystem::path path_;
    bool committed_ = false;
};

// Creates a new empty file "<destination>.XXXXXX" with mkstemp. An existing
// file is never opened, so other cache entries cannot be clobbered.
// Throws FilesystemError.
std::filesystem::path create_temp_file(const std::filesystem::path& destination);

// Downloads url into destination with GET. The body goes to a fresh temporary
// file next to destination which is renamed over it only after a complete 200
// response, so a failure never leaves partial data at destination.
// Throws SchemeError, FetchError (transport failure or non-200 status) or
// FilesystemError.
std::filesystem::path fetch_file(HttpClient& client, const std::string& url,
                                 const std::filesystem::path& destination,
                                 const FetchOptions& options, Logger& logger);
