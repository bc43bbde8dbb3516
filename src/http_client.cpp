#include "http_client.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>

#ifndef CFETCH_VERSION
#define CFETCH_VERSION "unknown"
#endif

void HttpHeaders::add(std::string_view name, std::string_view value) {
    values_.emplace(to_lower(trim(name)), std::string(trim(value)));
}

std::string HttpHeaders::get(std::string_view name) const {
    auto it = values_.find(to_lower(name));
    return it != values_.end() ? it->second : std::string();
}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

namespace {
    // Custom deleter for the CURL handle
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

    struct BodyContext {
        CURL* curl = nullptr;
        ByteSink* sink = nullptr;
        bool started = false;
        bool forward = false;
        std::exception_ptr error;
    };

    // Collects the headers of the final response; a new status line (redirect
    // hop, 100-continue) starts over.
    size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* response = static_cast<HttpResponse*>(userdata);
        const size_t bytes = size * nitems;
        std::string_view line(buffer, bytes);

        if (line.starts_with("HTTP/")) {
            response->headers.clear();
            response->reason.clear();
            // "HTTP/1.1 404 Not Found": reason follows the second space
            size_t code = line.find(' ');
            if (code != std::string_view::npos) {
                size_t reason = line.find(' ', code + 1);
                if (reason != std::string_view::npos) {
                    response->reason = std::string(trim(line.substr(reason + 1)));
                }
            }
            return bytes;
        }

        size_t colon = line.find(':');
        if (colon != std::string_view::npos) {
            response->headers.add(line.substr(0, colon), line.substr(colon + 1));
        }
        return bytes;
    }

    size_t body_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<BodyContext*>(userdata);
        const size_t bytes = size * nmemb;

        try {
            if (!ctx->started) {
                ctx->started = true;
                long code = 0;
                curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
                ctx->forward = (code == 200);
                if (ctx->forward) {
                    curl_off_t length = -1;
                    curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
                    ctx->sink->start(static_cast<std::int64_t>(length));
                }
            }
            if (ctx->forward) {
                ctx->sink->write(ptr, bytes);
            }
        } catch (...) {
            // Cannot unwind through libcurl; rethrown once curl_easy_perform returns.
            ctx->error = std::current_exception();
            return 0;
        }
        return bytes;
    }

    CurlHandle make_handle(const std::string& url, const RequestOptions& options, HttpResponse& response) {
        CurlHandle curl(curl_easy_init());
        if (!curl) {
            throw TransportError(string_format("error.curl_init_failed", url));
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "cfetch/" CFETCH_VERSION);
        curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);

        if (options.timeout.count() > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
            curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.timeout.count()));
        }
        return curl;
    }

    void perform(CURL* curl, const std::string& url, HttpResponse& response) {
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            throw TransportError(string_format("error.request_failed", url, curl_easy_strerror(res)));
        }
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
}

HttpResponse CurlHttpClient::head(const std::string& url, const RequestOptions& options) {
    HttpResponse response;
    CurlHandle curl = make_handle(url, options, response);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L); // will trigger the HEAD verb

    perform(curl.get(), url, response);
    return response;
}

HttpResponse CurlHttpClient::get(const std::string& url, ByteSink& sink, const RequestOptions& options) {
    HttpResponse response;
    CurlHandle curl = make_handle(url, options, response);

    BodyContext body;
    body.curl = curl.get();
    body.sink = &sink;
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(curl.get());
    if (body.error) {
        std::rethrow_exception(body.error);
    }
    if (res != CURLE_OK) {
        throw TransportError(string_format("error.request_failed", url, curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    // A 200 with an empty body never reaches body_callback.
    if (!body.started && response.status == 200) {
        sink.start(0);
    }
    return response;
}
