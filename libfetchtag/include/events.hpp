//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_EVENTS_HPP
#define FETCHTAG_EVENTS_HPP

#include "classified_error.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fetchtag {

enum class WorkflowState;

/**
 * @brief Events published on the EventBus while a workflow runs.
 *
 * Plain data carriers. Progress percentages go through IProgressSink; these
 * are for subscribers that want structured outcomes (reports, GUIs, tests).
 */

// --- detector ---

/**
 * @brief A matching file was seen for the first time in the watched directory.
 */
struct FileDetectedEvent {
    std::filesystem::path path;
};

/**
 * @brief A candidate passed the size-stability and header checks.
 */
struct FileStabilizedEvent {
    std::filesystem::path path;
    std::uintmax_t size = 0;
    std::chrono::milliseconds waited{0};
};

/**
 * @brief A candidate was dropped (vanished, never stabilized, unreadable).
 */
struct CandidateFailedEvent {
    std::filesystem::path path;
    ClassifiedError error;
};

// --- tag engine ---

/**
 * @brief A mutation failed and the original bytes were put back.
 */
struct MutationRolledBackEvent {
    std::filesystem::path path;
    ClassifiedError cause;
};

// --- workflow ---

/**
 * @brief The orchestrator entered a new state.
 */
struct WorkflowStageEvent {
    WorkflowState state;
    std::chrono::steady_clock::time_point at;
};

/**
 * @brief The workflow finished and the file carries the requested tags.
 */
struct WorkflowSucceededEvent {
    std::filesystem::path path;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief The workflow ended in Failed. Exactly one per failed run.
 */
struct WorkflowFailedEvent {
    ClassifiedError error;
    std::chrono::milliseconds duration{0};
    bool cleanup_ok = true;
};

} // namespace fetchtag

#endif // FETCHTAG_EVENTS_HPP
