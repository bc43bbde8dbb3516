#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// Lowercased scheme of an absolute URL, or an empty string when there is none.
std::string url_scheme(std::string_view url);

bool is_http_url(std::string_view url);

// Throws SchemeError unless the URL is http or https.
void require_http_url(std::string_view url);

// Last non-empty segment of the URL path, with query and fragment removed.
// Empty when the path has no such segment.
std::string url_basename(std::string_view url);

// Deterministic cache location for a URL: absolute(cache_dir) / url_basename(url).
// Throws CfetchException when the URL names no file.
std::filesystem::path cache_path_for(const std::filesystem::path& cache_dir, std::string_view url);
