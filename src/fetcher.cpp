#include "fetcher.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "sink.hpp"
#include "url.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

PartialFileGuard::~PartialFileGuard() {
    if (!committed_) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
}

fs::path create_temp_file(const fs::path& destination) {
    std::string pattern = destination.string() + ".XXXXXX";
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemp(name.data());
    if (fd < 0) {
        throw FilesystemError(string_format("error.create_file_failed", pattern) + ": " + std::strerror(errno));
    }
    // mkstemp creates 0600; cache entries are 0644.
    if (fchmod(fd, 0644) != 0) {
        int err = errno;
        close(fd);
        unlink(name.data());
        throw FilesystemError(string_format("error.create_file_failed", pattern) + ": " + std::strerror(err));
    }
    close(fd);
    return fs::path(name.data());
}

fs::path fetch_file(HttpClient& client, const std::string& url, const fs::path& destination,
                    const FetchOptions& options, Logger& logger) {
    require_http_url(url);

    logger.info(string_format("info.downloading", url));

    const fs::path partial = create_temp_file(destination);
    PartialFileGuard guard(partial);

    HttpResponse response;
    {
        FileSink file(partial);
        std::optional<ProgressSink> progress;
        if (options.progress) {
            progress.emplace(file, *options.progress, destination.filename().string());
        }
        ByteSink& sink = progress ? static_cast<ByteSink&>(*progress) : file;

        try {
            response = client.get(url, sink, options.request);
        } catch (const TransportError& e) {
            throw FetchError(string_format("error.download_failed", url) + ": " + e.what(), url);
        }

        if (response.status != 200) {
            std::string status = std::to_string(response.status);
            if (!response.reason.empty()) {
                status += " " + response.reason;
            }
            throw FetchError(string_format("error.bad_status", url, status), url, response.status);
        }
        sink.finish();
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        throw FilesystemError(string_format("error.rename_failed", partial.string(), destination.string()) + ": " + ec.message());
    }
    guard.commit();

    logger.debug(string_format("debug.saved", destination.string()));
    return destination;
}
