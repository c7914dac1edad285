//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by every fetchtag component.
 *
 * The detector's observer thread, the workflow worker and the CLI all log
 * through here concurrently, so every call is serialized on one mutex.
 */

#ifndef FETCHTAG_LOGGER_HPP
#define FETCHTAG_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class Logger {
public:
    /**
     * @brief Install a sink. The Logger takes ownership.
     * @param sink Sink implementation; null is ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Remove every installed sink.
    static void clear_sinks();

    /// @return Number of installed sinks.
    static std::size_t sink_count();

    /**
     * @brief Fan a record out to all sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "fetchtag").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "fetchtag");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by --log-level.
     * Case-insensitive. Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(const std::string& level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif //FETCHTAG_LOGGER_HPP
