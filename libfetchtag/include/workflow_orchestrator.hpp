//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file workflow_orchestrator.hpp
 * @brief Sequences one download-and-tag job.
 *
 * trigger remote conversion -> wait for the finished file -> rewrite its tags,
 * on a dedicated worker thread, one job at a time. Whatever happens, the
 * remote trigger is closed and the detector is stopped before the job is
 * reported as finished.
 */

#ifndef FETCHTAG_WORKFLOW_ORCHESTRATOR_HPP
#define FETCHTAG_WORKFLOW_ORCHESTRATOR_HPP

#include "classified_error.hpp"
#include "completion_detector.hpp"
#include "metadata_fields.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace fetchtag {

class EventBus;
class IProgressSink;
class IRemoteTrigger;
class TagMutationEngine;

enum class WorkflowState {
    Idle,
    Triggering,
    AwaitingFile,
    Mutating,
    Succeeded,
    Failed
};

const char* to_string(WorkflowState state) noexcept;

/// @return true while a job occupies the orchestrator.
[[nodiscard]] bool is_in_flight(WorkflowState state) noexcept;

/// @return true if the orchestrator may move from @p from to @p to.
[[nodiscard]] bool is_allowed_transition(WorkflowState from, WorkflowState to) noexcept;

struct WorkflowSettings {
    WatchTarget watch;
    std::chrono::seconds download_timeout{300};
    std::chrono::seconds fallback_lookback{600};
    int max_retry_attempts = 3;
};

/**
 * @brief Snapshot returned by WorkflowOrchestrator::status().
 */
struct WorkflowStatus {
    WorkflowState state = WorkflowState::Idle;
    std::chrono::milliseconds elapsed{0};    ///< of the current run, or the whole last run once finished
    bool detector_active = false;
    int attempt = 0;
    std::optional<std::filesystem::path> result;
    std::optional<ClassifiedError> error;
};

class WorkflowOrchestrator {
public:
    /**
     * @param trigger Remote conversion capability; opened and closed per run.
     * @param detector Started per run, always stopped before the run ends.
     * @param engine Applies the requested tags to the downloaded file.
     * @param bus Receives WorkflowStageEvent / WorkflowSucceededEvent / WorkflowFailedEvent.
     * @param progress Optional milestone sink, called from the worker thread.
     */
    WorkflowOrchestrator(IRemoteTrigger& trigger,
                         CompletionDetector& detector,
                         TagMutationEngine& engine,
                         WorkflowSettings settings,
                         EventBus& bus,
                         IProgressSink* progress = nullptr);

    /// @brief Cancels a running job and waits for its cleanup.
    ~WorkflowOrchestrator();

    WorkflowOrchestrator(const WorkflowOrchestrator&) = delete;
    WorkflowOrchestrator& operator=(const WorkflowOrchestrator&) = delete;

    /**
     * @brief Start a job and return immediately.
     * @throws FetchtagError WorkflowAlreadyRunning while a job is in flight,
     * InputValidation for a malformed request. Neither has side effects.
     */
    void submit(const WorkflowRequest& request);

    /**
     * @brief Stop the running job; it ends in Failed with a Cancelled error.
     *
     * Blocks until the worker has released its resources. Called from the
     * worker thread itself it only requests the stop.
     *
     * @return false if closing the trigger or stopping the detector reported an error.
     */
    bool cancel();

    /**
     * @brief Run the last request again.
     * @throws FetchtagError the last error when it is not retryable or the
     * attempt cap is reached; WorkflowAlreadyRunning while a job is in flight.
     */
    void retry();

    /// @brief Block until no job is in flight. @return true if the last job succeeded.
    bool wait();

    /// @return false if the job is still in flight after @p timeout.
    bool wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] WorkflowState state() const;
    [[nodiscard]] std::optional<ClassifiedError> last_error() const;
    [[nodiscard]] std::optional<std::filesystem::path> result_path() const;
    [[nodiscard]] WorkflowStatus status() const;
    [[nodiscard]] const WorkflowSettings& settings() const noexcept { return settings_; }

private:
    void start(const WorkflowRequest& request, int attempt);
    void run(const std::stop_token& st, const WorkflowRequest& request);
    std::filesystem::path await_download(const std::stop_token& st);
    void set_state(WorkflowState next);
    void finish(std::optional<ClassifiedError> failure, std::optional<std::filesystem::path> produced, bool cleanup_ok);
    void report(const std::string& message, int percent);

    IRemoteTrigger& trigger_;
    CompletionDetector& detector_;
    TagMutationEngine& engine_;
    WorkflowSettings settings_;
    EventBus& bus_;
    IProgressSink* progress_;

    mutable std::mutex mtx_;
    std::condition_variable done_cv_;
    WorkflowState state_ = WorkflowState::Idle;
    std::optional<WorkflowRequest> last_request_;
    std::optional<ClassifiedError> last_error_;
    std::optional<std::filesystem::path> result_;
    int attempt_ = 0;
    bool cleanup_ok_ = true;
    std::chrono::steady_clock::time_point started_{};
    std::chrono::steady_clock::time_point finished_{};

    std::mutex worker_mtx_;
    std::jthread worker_;
    std::stop_source stop_source_;    // replaced per run before the worker starts
    std::atomic<std::thread::id> worker_id_{};
    int last_percent_ = 0;
};

} // namespace fetchtag

#endif // FETCHTAG_WORKFLOW_ORCHESTRATOR_HPP
