#pragma once

#include "http_client.hpp"

#include <string>

// Response header carrying the hex SHA-256 of the resource.
inline constexpr const char* CHECKSUM_HEADER = "X-Checksum-Sha256";

struct RemoteDescriptor {
    std::string sha256; // empty when the server sent no checksum
    std::string length; // raw Content-Length value, empty when absent
};

// Sends a HEAD request and reads the checksum and length headers.
// Throws SchemeError for non-HTTP(S) URLs before touching the network and
// ProbeError when the server cannot be reached.
RemoteDescriptor probe_remote(HttpClient& client, const std::string& url, const RequestOptions& options = {});
