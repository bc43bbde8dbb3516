#include "url.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cctype>

namespace {
    // RFC 3986: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    bool is_scheme_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    }
}

std::string url_scheme(std::string_view url) {
    size_t colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return {};
    }
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return {};
    }
    for (size_t i = 1; i < colon; ++i) {
        if (!is_scheme_char(url[i])) {
            return {};
        }
    }
    return to_lower(url.substr(0, colon));
}

bool is_http_url(std::string_view url) {
    const std::string scheme = url_scheme(url);
    return scheme == "http" || scheme == "https";
}

void require_http_url(std::string_view url) {
    if (!is_http_url(url)) {
        throw SchemeError(string_format("error.non_http_url", std::string(url)));
    }
}

std::string url_basename(std::string_view url) {
    std::string_view rest = url;

    size_t end = rest.find_first_of("?#");
    if (end != std::string_view::npos) {
        rest = rest.substr(0, end);
    }

    // Drop "scheme://authority" so a bare host is never taken as a file name.
    size_t authority = rest.find("://");
    if (authority != std::string_view::npos) {
        rest.remove_prefix(authority + 3);
        size_t path_start = rest.find('/');
        if (path_start == std::string_view::npos) {
            return {};
        }
        rest.remove_prefix(path_start);
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.remove_suffix(1);
    }
    size_t slash = rest.rfind('/');
    if (slash != std::string_view::npos) {
        rest.remove_prefix(slash + 1);
    }
    if (rest == "." || rest == "..") {
        return {};
    }
    return std::string(rest);
}

std::filesystem::path cache_path_for(const std::filesystem::path& cache_dir, std::string_view url) {
    const std::string name = url_basename(url);
    if (name.empty()) {
        throw CfetchException(string_format("error.url_no_file_name", std::string(url)));
    }
    return std::filesystem::absolute(cache_dir) / name;
}
