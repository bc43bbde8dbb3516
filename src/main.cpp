#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

#ifndef CFETCH_VERSION
#define CFETCH_VERSION "unknown"
#endif

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.usage_urls") << std::endl;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.positional_help("<url>...");
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("version", get_string("help.version"))
            ("c,cache-dir", get_string("help.cache_dir"), cxxopts::value<std::string>())
            ("p,progress", get_string("help.progress"))
            ("no-progress", get_string("help.no_progress"))
            ("t,timeout", get_string("help.timeout"), cxxopts::value<long long>())
            ("v,verbose", get_string("help.verbose"))
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("urls", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"urls"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("version")) {
            std::cout << "cfetch " << CFETCH_VERSION << std::endl;
            return 0;
        }

        fs::path config_file = default_config_file();
        if (result.count("config")) {
            config_file = result["config"].as<std::string>();
            if (!fs::exists(config_file)) {
                throw CfetchException(string_format("error.config_not_found", config_file.string()));
            }
        }
        Settings settings = load_settings(config_file);

        if (result.count("cache-dir")) {
            settings.cache_dir = result["cache-dir"].as<std::string>();
        }
        if (result.count("progress")) {
            settings.progress = true;
        }
        if (result.count("no-progress")) {
            settings.progress = false;
        }
        if (result.count("timeout")) {
            long long seconds = result["timeout"].as<long long>();
            if (!is_valid_timeout(seconds)) {
                throw CfetchException(string_format("error.invalid_timeout", seconds));
            }
            settings.timeout = std::chrono::seconds(seconds);
        }
        if (result.count("verbose")) {
            settings.verbose = true;
        }
        set_verbose_mode(settings.verbose);

        if (!result.count("urls")) {
            print_usage(options);
            throw CfetchException(get_string("error.no_urls"));
        }

        ensure_dir_exists(settings.cache_dir);
        log_debug(string_format("debug.cache_dir", settings.cache_dir.string()));

        CurlHttpClient client;
        ConsoleLogger logger;
        ConsoleProgressBar progress_bar;
        Downloader downloader(client, logger, progress_bar);

        for (const auto& url : result["urls"].as<std::vector<std::string>>()) {
            DownloadRequest request;
            request.cache_dir = settings.cache_dir;
            request.url = url;
            request.progress = settings.progress;
            request.timeout = settings.timeout;

            std::cout << downloader.download(request).string() << std::endl;
        }
    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const CfetchException& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
