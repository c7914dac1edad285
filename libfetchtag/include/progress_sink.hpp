//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_PROGRESS_SINK_HPP
#define FETCHTAG_PROGRESS_SINK_HPP

#include <string>

namespace fetchtag {

/**
 * @brief Receives workflow milestones (0, 30, 40, 80, 100).
 *
 * Called from the workflow worker thread.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void report(const std::string& message, int percent) = 0;
};

} // namespace fetchtag

#endif // FETCHTAG_PROGRESS_SINK_HPP
