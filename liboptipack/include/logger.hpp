/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * The Logger class is the single entry point for logging inside the
 * library. Messages below the global threshold are dropped before they
 * reach any sink.
 */

#ifndef OPTIPACK_LOGGER_HPP
#define OPTIPACK_LOGGER_HPP

#include "log_sink.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace optipack {

/**
 * @brief Static logging facade for optipack.
 *
 * Delegates every accepted message to all registered ILogSink
 * implementations. All operations are thread-safe.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Set the global threshold. Messages below it are discarded.
     */
    static void set_level(LogLevel level) noexcept;

    [[nodiscard]] static LogLevel level() noexcept;

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "optipack").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "optipack");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-insensitive. Returns LogLevel::Error if not matched.
     * @param level The string value (e.g., "debug", "INFO").
     * @return The corresponding LogLevel enum.
     */
    static LogLevel string_to_level(std::string level) {
        std::ranges::transform(level, level.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        if (level == "NONE")
            return LogLevel::None;
        return LogLevel::Error;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
    ///< Global threshold, checked without taking mtx_.
    static std::atomic<LogLevel> threshold_;
};

} // namespace optipack

#endif // OPTIPACK_LOGGER_HPP
