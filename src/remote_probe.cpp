#include "remote_probe.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "url.hpp"

RemoteDescriptor probe_remote(HttpClient& client, const std::string& url, const RequestOptions& options) {
    require_http_url(url);

    HttpResponse response;
    try {
        response = client.head(url, options);
    } catch (const TransportError& e) {
        throw ProbeError(string_format("error.probe_failed", url) + ": " + e.what());
    }

    // Headers are read whatever the status; an absent header leaves its field empty.
    RemoteDescriptor remote;
    remote.sha256 = response.headers.get(CHECKSUM_HEADER);
    remote.length = response.headers.get("Content-Length");
    return remote;
}
