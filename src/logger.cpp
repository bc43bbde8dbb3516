#include "logger.hpp"
#include "utils.hpp"

void ConsoleLogger::debug(std::string_view msg) {
    log_debug(msg);
}

void ConsoleLogger::info(std::string_view msg) {
    log_info(msg);
}

void ConsoleLogger::warning(std::string_view msg) {
    log_warning(msg);
}

void ConsoleLogger::error(std::string_view msg) {
    log_error(msg);
}
