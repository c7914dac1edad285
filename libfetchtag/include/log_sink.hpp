//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_LOG_SINK_HPP
#define FETCHTAG_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter what reaches the console; the file sink
 * records everything.
 */
enum class LogLevel {
    Debug,   ///< Poll-by-poll detail (sizes, header checks, phase changes)
    Info,    ///< Workflow milestones
    Warning, ///< Recoverable trouble (transient I/O, a candidate dropped)
    Error    ///< A classified error was raised
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a record goes (console, file, a GUI
 * status line). The Logger facade fans every record out to all
 * installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced it ("detector", "tag_engine", ...).
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // FETCHTAG_LOG_SINK_HPP
