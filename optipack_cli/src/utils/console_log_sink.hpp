#ifndef OPTIPACK_CONSOLE_LOG_SINK_HPP
#define OPTIPACK_CONSOLE_LOG_SINK_HPP

#include "../../../liboptipack/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Writes log lines to the terminal. Debug and info go to stdout,
 * warnings and errors to stderr.
 */
class ConsoleLogSink final : public optipack::ILogSink {
public:
    optipack::LogLevel log_level = optipack::LogLevel::Info;

    void log(const optipack::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using optipack::LogLevel;
        if (log_level == LogLevel::None || level < log_level) {
            return;
        }
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::None:
                break;
        }
    }
};

#endif // OPTIPACK_CONSOLE_LOG_SINK_HPP
