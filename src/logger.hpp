#pragma once

#include <string_view>

// Leveled logging sink handed to the download pipeline.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void debug(std::string_view msg) = 0;
    virtual void info(std::string_view msg) = 0;
    virtual void warning(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
};

// Writes through the console log functions in utils.hpp.
class ConsoleLogger : public Logger {
public:
    void debug(std::string_view msg) override;
    void info(std::string_view msg) override;
    void warning(std::string_view msg) override;
    void error(std::string_view msg) override;
};

class NullLogger : public Logger {
public:
    void debug(std::string_view) override {}
    void info(std::string_view) override {}
    void warning(std::string_view) override {}
    void error(std::string_view) override {}
};
