//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_CONSOLE_PROGRESS_SINK_HPP
#define FETCHTAG_CONSOLE_PROGRESS_SINK_HPP

#include "../../../libfetchtag/include/progress_sink.hpp"
#include <chrono>
#include <mutex>
#include <string>

/**
 * @brief Redraws a single-line progress bar on stderr for each workflow milestone.
 */
class ConsoleProgressSink final : public fetchtag::IProgressSink {
public:
    ConsoleProgressSink();

    void report(const std::string& message, int percent) override;

    /// @brief End the bar's line so later output starts on a fresh one.
    void finish();

private:
    std::mutex mtx_;
    std::chrono::steady_clock::time_point started_;
    bool drawn_ = false;
};

#endif // FETCHTAG_CONSOLE_PROGRESS_SINK_HPP
