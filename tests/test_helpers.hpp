#pragma once

#include "exception.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "logger.hpp"
#include "progress.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

inline constexpr const char* HELLO_WORLD_SHA256 = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";
inline constexpr const char* EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
inline constexpr const char* FRESH_BODY = "fresh artifact v2";
inline constexpr const char* FRESH_SHA256 = "7289af80fd87cc4811fdd3d04251c468f70cfaabee99d5014c6f78e5f3c98d91";
inline constexpr const char* OLD_BODY = "old artifact v1";
inline constexpr const char* OLD_SHA256 = "b00ae6bc3d3cf68d869d7bf634faf43d5d64bd6cac03754f45ff01dfa8bfe9a8";

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// In-memory HttpClient. Unknown URLs answer 404; resources may be marked
// unreachable for HEAD, GET or both.
class FakeHttpClient : public HttpClient {
public:
    struct Resource {
        long status = 200;
        std::string reason = "OK";
        std::string body;
        HttpHeaders headers;
        bool head_unreachable = false;
        bool get_unreachable = false;
        // Chunks the body is delivered in; 0 delivers it in one piece.
        std::size_t chunk_size = 0;
        // Sends this many body bytes, then fails as a dropped connection.
        std::size_t fail_after = std::string::npos;
    };

    Resource& serve(const std::string& url, const std::string& body) {
        Resource& r = resources[url];
        r.body = body;
        r.headers.add("Content-Length", std::to_string(body.size()));
        return r;
    }

    HttpResponse head(const std::string& url, const RequestOptions& options) override {
        head_calls.push_back(url);
        last_options = options;
        auto it = resources.find(url);
        if (it == resources.end()) {
            return not_found();
        }
        if (it->second.head_unreachable) {
            throw TransportError("request to " + url + " failed: Couldn't resolve host name");
        }
        HttpResponse response;
        response.status = it->second.status;
        response.reason = it->second.reason;
        response.headers = it->second.headers;
        return response;
    }

    HttpResponse get(const std::string& url, ByteSink& sink, const RequestOptions& options) override {
        get_calls.push_back(url);
        last_options = options;
        auto it = resources.find(url);
        if (it == resources.end()) {
            return not_found();
        }
        const Resource& r = it->second;
        if (r.get_unreachable) {
            throw TransportError("request to " + url + " failed: Couldn't connect to server");
        }

        HttpResponse response;
        response.status = r.status;
        response.reason = r.reason;
        response.headers = r.headers;
        if (r.status != 200) {
            return response;
        }

        sink.start(static_cast<std::int64_t>(r.body.size()));
        const std::size_t limit = std::min(r.fail_after, r.body.size());
        const std::size_t step = r.chunk_size == 0 ? std::max<std::size_t>(limit, 1) : r.chunk_size;
        for (std::size_t offset = 0; offset < limit; offset += step) {
            sink.write(r.body.data() + offset, std::min(step, limit - offset));
        }
        if (r.fail_after < r.body.size()) {
            throw TransportError("request to " + url + " failed: Connection reset by peer");
        }
        return response;
    }

    std::map<std::string, Resource> resources;
    std::vector<std::string> head_calls;
    std::vector<std::string> get_calls;
    RequestOptions last_options;

private:
    static HttpResponse not_found() {
        HttpResponse response;
        response.status = 404;
        response.reason = "Not Found";
        return response;
    }
};

class RecordingLogger : public Logger {
public:
    void debug(std::string_view msg) override { entries.emplace_back("debug", std::string(msg)); }
    void info(std::string_view msg) override { entries.emplace_back("info", std::string(msg)); }
    void warning(std::string_view msg) override { entries.emplace_back("warning", std::string(msg)); }
    void error(std::string_view msg) override { entries.emplace_back("error", std::string(msg)); }

    bool contains(const std::string& level, const std::string& text) const {
        return std::any_of(entries.begin(), entries.end(), [&](const auto& entry) {
            return entry.first == level && entry.second.find(text) != std::string::npos;
        });
    }

    std::vector<std::pair<std::string, std::string>> entries;
};

class RecordingDisplay : public ProgressDisplay {
public:
    void start(const std::string& l, std::int64_t total) override {
        label = l;
        started_total = total;
        ++starts;
    }
    void update(const TransferStats& stats) override { updates.push_back(stats); }
    void finish(const TransferStats& stats) override {
        final_stats = stats;
        ++finishes;
    }

    std::string label;
    std::int64_t started_total = -2;
    int starts = 0;
    int finishes = 0;
    std::vector<TransferStats> updates;
    TransferStats final_stats;
};

// Fresh scratch directory under the working directory for every test.
class ScratchDirTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        // Assertions match the English catalog.
        setenv("LANG", "C", 1);
        set_l10n_dir(CFETCH_TEST_L10N_DIR);
        init_localization();

        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        work_dir = fs::absolute("tmp_cfetch_test") / (std::string(info->test_suite_name()) + "_" + info->name());
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }
};
