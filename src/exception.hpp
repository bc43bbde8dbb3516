#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class CfetchException : public std::runtime_error {
public:
    explicit CfetchException(const std::string& message)
        : std::runtime_error(message) {}
};

// stat/open/remove/rename failures other than "not found"
class FilesystemError : public CfetchException {
public:
    using CfetchException::CfetchException;
};

class HashError : public CfetchException {
public:
    using CfetchException::CfetchException;
};

// URL is not http(s); raised before any network attempt
class SchemeError : public CfetchException {
public:
    using CfetchException::CfetchException;
};

// Raised by HttpClient implementations when no response could be obtained.
class TransportError : public CfetchException {
public:
    using CfetchException::CfetchException;
};

// The metadata probe could not reach the remote.
class ProbeError : public CfetchException {
public:
    using CfetchException::CfetchException;
};

class FetchError : public CfetchException {
public:
    FetchError(const std::string& message, std::string url, long status = 0)
        : CfetchException(message), url_(std::move(url)), status_(status) {}

    const std::string& url() const { return url_; }
    // 0 when no HTTP response was received
    long status() const { return status_; }

private:
    std::string url_;
    long status_;
};
