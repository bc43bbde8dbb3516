#pragma once

#include "sink.hpp"

#include <chrono>
#include <map>
#include <string>
#include <string_view>

// Header names compare case-insensitively; the first value seen for a name wins.
class HttpHeaders {
public:
    void add(std::string_view name, std::string_view value);
    // Empty string when the header is absent.
    std::string get(std::string_view name) const;
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string, std::less<>> values_;
};

struct HttpResponse {
    long status = 0;
    std::string reason;
    HttpHeaders headers;
};

struct RequestOptions {
    // Limit for the whole request; zero means no limit.
    std::chrono::milliseconds timeout{0};
};

// Blocking HTTP transport. Both calls throw TransportError when no response
// could be obtained (DNS, connect, TLS, reset, timeout). An HTTP error status
// is not a transport failure.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse head(const std::string& url, const RequestOptions& options) = 0;

    // Body bytes reach the sink only when the final status is 200; the sink's
    // start() is called before the first chunk. Exceptions thrown by the sink
    // propagate out of get().
    virtual HttpResponse get(const std::string& url, ByteSink& sink, const RequestOptions& options) = 0;
};

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();

    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

class CurlHttpClient : public HttpClient {
public:
    HttpResponse head(const std::string& url, const RequestOptions& options) override;
    HttpResponse get(const std::string& url, ByteSink& sink, const RequestOptions& options) override;
};
