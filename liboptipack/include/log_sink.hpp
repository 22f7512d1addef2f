#ifndef OPTIPACK_LOG_SINK_HPP
#define OPTIPACK_LOG_SINK_HPP

#include <string_view>

namespace optipack {

/**
 * @brief Severity levels for log messages.
 *
 * Levels are ordered: a sink or threshold set to a level accepts that
 * level and everything more severe. None disables output entirely.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, per-file outcomes
    Info,    ///< Job lifecycle and service operation
    Warning, ///< Recoverable problems (skipped entries, abandoned jobs)
    Error,   ///< Failures that end a job or a request
    None     ///< Threshold only: suppress every message
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where log messages are delivered (console,
 * file, a test collector). The Logger fans out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace optipack

#endif // OPTIPACK_LOG_SINK_HPP
