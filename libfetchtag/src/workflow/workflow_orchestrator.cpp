//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/workflow_orchestrator.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/progress_sink.hpp"
#include "../../include/remote_trigger.hpp"
#include "../../include/tag_mutation_engine.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace fetchtag {

namespace {

constexpr auto kTag = "workflow";

/**
 * @brief Releases the per-run resources exactly once.
 *
 * The destructor covers exits by exception; release() lets the worker learn
 * whether cleanup succeeded before it publishes the outcome.
 */
class RunResources {
public:
    RunResources(IRemoteTrigger& trigger, CompletionDetector& detector)
        : trigger_(trigger), detector_(detector) {}

    ~RunResources() { release(); }

    RunResources(const RunResources&) = delete;
    RunResources& operator=(const RunResources&) = delete;

    bool release() {
        if (released_) return ok_;
        released_ = true;

        try {
            if (!trigger_.close()) {
                Logger::log(LogLevel::Warning, "Remote trigger did not close cleanly", kTag);
                ok_ = false;
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, std::string("Closing remote trigger failed: ") + e.what(), kTag);
            ok_ = false;
        }

        if (!detector_.stop_watching()) {
            Logger::log(LogLevel::Warning, "Detector did not release its watch cleanly", kTag);
            ok_ = false;
        }
        return ok_;
    }

private:
    IRemoteTrigger& trigger_;
    CompletionDetector& detector_;
    bool released_ = false;
    bool ok_ = true;
};

Stage stage_of(const WorkflowState state) {
    switch (state) {
        case WorkflowState::Triggering:   return Stage::Triggering;
        case WorkflowState::AwaitingFile: return Stage::AwaitingFile;
        case WorkflowState::Mutating:     return Stage::Mutating;
        default:                          return Stage::Orchestration;
    }
}

// an exception that is not a FetchtagError, attributed to the stage it escaped from
ClassifiedError unexpected_error(const WorkflowState state, const std::string& what) {
    switch (state) {
        case WorkflowState::Triggering:
            return ClassifiedError::make(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering, what);
        case WorkflowState::Mutating:
            return ClassifiedError::make(ErrorKind::MutationFailed, Stage::Mutating, what);
        default:
            return ClassifiedError::make(ErrorKind::FileSystemAccess, stage_of(state), what);
    }
}

void throw_if_cancelled(const std::stop_token& st, const Stage stage) {
    if (st.stop_requested()) {
        throw FetchtagError(ErrorKind::Cancelled, stage, "workflow cancelled");
    }
}

std::chrono::milliseconds since(const std::chrono::steady_clock::time_point from,
                                const std::chrono::steady_clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

} // namespace

const char* to_string(const WorkflowState state) noexcept {
    switch (state) {
        case WorkflowState::Idle:         return "Idle";
        case WorkflowState::Triggering:   return "Triggering";
        case WorkflowState::AwaitingFile: return "AwaitingFile";
        case WorkflowState::Mutating:     return "Mutating";
        case WorkflowState::Succeeded:    return "Succeeded";
        case WorkflowState::Failed:       return "Failed";
    }
    return "Unknown";
}

bool is_in_flight(const WorkflowState state) noexcept {
    return state == WorkflowState::Triggering ||
           state == WorkflowState::AwaitingFile ||
           state == WorkflowState::Mutating;
}

bool is_allowed_transition(const WorkflowState from, const WorkflowState to) noexcept {
    switch (from) {
        case WorkflowState::Idle:
        case WorkflowState::Succeeded:
        case WorkflowState::Failed:
            return to == WorkflowState::Triggering;
        case WorkflowState::Triggering:
            return to == WorkflowState::AwaitingFile || to == WorkflowState::Failed;
        case WorkflowState::AwaitingFile:
            return to == WorkflowState::Mutating || to == WorkflowState::Failed;
        case WorkflowState::Mutating:
            return to == WorkflowState::Succeeded || to == WorkflowState::Failed;
    }
    return false;
}

WorkflowOrchestrator::WorkflowOrchestrator(IRemoteTrigger& trigger,
                                           CompletionDetector& detector,
                                           TagMutationEngine& engine,
                                           WorkflowSettings settings,
                                           EventBus& bus,
                                           IProgressSink* progress)
    : trigger_(trigger),
      detector_(detector),
      engine_(engine),
      settings_(std::move(settings)),
      bus_(bus),
      progress_(progress) {
}

WorkflowOrchestrator::~WorkflowOrchestrator() {
    cancel();
}

void WorkflowOrchestrator::submit(const WorkflowRequest& request) {
    start(request, 1);
}

void WorkflowOrchestrator::retry() {
    WorkflowRequest request;
    int next_attempt = 0;
    {
        std::lock_guard lock(mtx_);
        if (is_in_flight(state_)) {
            throw FetchtagError(ErrorKind::WorkflowAlreadyRunning, Stage::Orchestration,
                                "a workflow is already running");
        }
        if (!last_error_ || !last_request_) {
            throw FetchtagError(ErrorKind::InputValidation, Stage::Orchestration,
                                "there is no failed workflow to retry");
        }
        if (!last_error_->retryable) {
            throw FetchtagError(*last_error_);
        }
        if (attempt_ >= settings_.max_retry_attempts) {
            Logger::log(LogLevel::Warning, "Retry limit of " + std::to_string(settings_.max_retry_attempts) +
                        " attempts reached", kTag);
            throw FetchtagError(*last_error_);
        }
        request = *last_request_;
        next_attempt = attempt_ + 1;
    }
    start(request, next_attempt);
}

void WorkflowOrchestrator::start(const WorkflowRequest& request, const int attempt) {
    std::lock_guard worker_lock(worker_mtx_);
    {
        std::lock_guard lock(mtx_);
        if (is_in_flight(state_)) {
            throw FetchtagError(ErrorKind::WorkflowAlreadyRunning, Stage::Orchestration,
                                "a workflow is already running");
        }
    }
    if (const auto problems = request.validate(); !problems.empty()) {
        throw FetchtagError(ErrorKind::InputValidation, Stage::Validation, join_messages(problems));
    }

    // the previous worker has already published its outcome
    if (worker_.joinable()) worker_.join();

    {
        std::lock_guard lock(mtx_);
        state_ = WorkflowState::Triggering;
        last_request_ = request;
        last_error_.reset();
        result_.reset();
        attempt_ = attempt;
        cleanup_ok_ = true;
        started_ = std::chrono::steady_clock::now();
        finished_ = {};
    }
    last_percent_ = 0;
    stop_source_ = std::stop_source{};

    worker_ = std::jthread([this, request, source = stop_source_](const std::stop_token& own) mutable {
        // jthread's own stop (destruction) and cancel() both end the run
        std::stop_callback relay(own, [&source] { source.request_stop(); });
        run(source.get_token(), request);
    });
}

void WorkflowOrchestrator::run(const std::stop_token& st, const WorkflowRequest& request) {
    worker_id_.store(std::this_thread::get_id());
    bus_.publish(WorkflowStageEvent{WorkflowState::Triggering, std::chrono::steady_clock::now()});
    Logger::log(LogLevel::Info, "Workflow attempt " + std::to_string(status().attempt) + " for " + request.source_url, kTag);

    std::optional<ClassifiedError> failure;
    std::optional<fs::path> produced;
    bool cleanup_ok = true;
    {
        RunResources resources(trigger_, detector_);
        try {
            report("Starting download", 0);
            trigger_.open();
            trigger_.perform_remote_conversion(request.source_url, st);
            throw_if_cancelled(st, Stage::Triggering);
            report("Download triggered", 30);

            set_state(WorkflowState::AwaitingFile);
            report("Waiting for download to complete", 40);
            const fs::path file = await_download(st);

            set_state(WorkflowState::Mutating);
            report("Applying metadata to " + file.filename().string(), 80);
            engine_.apply_fields(file, request.fields);
            // the new tags stay on disk; the run still ends as cancelled
            if (st.stop_requested()) {
                throw FetchtagError(ErrorKind::Cancelled, Stage::Mutating,
                                    "workflow cancelled after " + file.filename().string() + " was tagged");
            }
            produced = file;
        } catch (const FetchtagError& e) {
            failure = e.error();
        } catch (const std::exception& e) {
            failure = unexpected_error(state(), e.what());
        }
        cleanup_ok = resources.release();
    }

    // a stop turns any ordinary failure into a cancellation, but never hides data-loss risk
    if (failure && st.stop_requested() &&
        failure->kind != ErrorKind::Cancelled && failure->kind != ErrorKind::RestoreFailed) {
        failure = ClassifiedError::make(ErrorKind::Cancelled, failure->stage,
                                        "workflow cancelled (" + failure->message + ")");
    }

    finish(std::move(failure), std::move(produced), cleanup_ok);
    worker_id_.store(std::thread::id{});
}

fs::path WorkflowOrchestrator::await_download(const std::stop_token& st) {
    detector_.start_watching(settings_.watch);

    const auto file = detector_.await_new_file_or_recent(
        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.download_timeout),
        settings_.fallback_lookback, st);
    throw_if_cancelled(st, Stage::AwaitingFile);

    if (!file) {
        std::string message = "no completed download within " +
                              std::to_string(settings_.download_timeout.count()) + " seconds";
        if (const auto errors = detector_.candidate_errors(); !errors.empty()) {
            message += "; last candidate: " + errors.back().message;
        }
        throw FetchtagError(ErrorKind::DownloadTimeout, Stage::AwaitingFile, message);
    }
    return *file;
}

void WorkflowOrchestrator::set_state(const WorkflowState next) {
    {
        std::lock_guard lock(mtx_);
        if (!is_allowed_transition(state_, next)) {
            throw std::logic_error(std::string("illegal workflow transition ") +
                                   to_string(state_) + " -> " + to_string(next));
        }
        state_ = next;
    }
    Logger::log(LogLevel::Debug, std::string("Workflow state: ") + to_string(next), kTag);
    bus_.publish(WorkflowStageEvent{next, std::chrono::steady_clock::now()});
}

void WorkflowOrchestrator::finish(std::optional<ClassifiedError> failure,
                                  std::optional<fs::path> produced,
                                  const bool cleanup_ok) {
    const auto now = std::chrono::steady_clock::now();
    std::chrono::milliseconds duration{0};
    {
        std::lock_guard lock(mtx_);
        duration = since(started_, now);
    }

    const WorkflowState terminal = failure ? WorkflowState::Failed : WorkflowState::Succeeded;
    if (failure) {
        if (is_critical(failure->kind)) {
            Logger::log(LogLevel::Error, "CRITICAL: " + failure->describe(), kTag);
        } else {
            Logger::log(LogLevel::Error, "Workflow failed: " + failure->describe(), kTag);
        }
        if (!cleanup_ok) {
            Logger::log(LogLevel::Warning, "Cleanup after the failed workflow reported errors", kTag);
        }
        report(failure->user_message() + " (" + std::string(to_string(failure->stage)) + ")", last_percent_);
        bus_.publish(WorkflowFailedEvent{*failure, duration, cleanup_ok});
    } else {
        report("Done", 100);
        Logger::log(LogLevel::Info, "Workflow finished in " + std::to_string(duration.count() / 1000) +
                    "s: " + produced->string(), kTag);
        bus_.publish(WorkflowSucceededEvent{*produced, duration});
    }
    bus_.publish(WorkflowStageEvent{terminal, now});

    {
        std::lock_guard lock(mtx_);
        state_ = terminal;
        last_error_ = std::move(failure);
        result_ = std::move(produced);
        cleanup_ok_ = cleanup_ok;
        finished_ = now;
    }
    done_cv_.notify_all();
}

void WorkflowOrchestrator::report(const std::string& message, const int percent) {
    // never move backwards within one run
    last_percent_ = std::clamp(std::max(percent, last_percent_), 0, 100);
    if (progress_) progress_->report(message, last_percent_);
}

bool WorkflowOrchestrator::cancel() {
    if (worker_id_.load() == std::this_thread::get_id()) {
        stop_source_.request_stop();
        return true;
    }

    std::lock_guard worker_lock(worker_mtx_);
    if (worker_.joinable()) {
        if (is_in_flight(state())) {
            Logger::log(LogLevel::Info, "Cancelling workflow", kTag);
        }
        stop_source_.request_stop();
        worker_.join();
    }
    std::lock_guard lock(mtx_);
    return cleanup_ok_;
}

bool WorkflowOrchestrator::wait() {
    std::unique_lock lock(mtx_);
    done_cv_.wait(lock, [this] { return !is_in_flight(state_); });
    return state_ == WorkflowState::Succeeded;
}

bool WorkflowOrchestrator::wait_for(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mtx_);
    return done_cv_.wait_for(lock, timeout, [this] { return !is_in_flight(state_); });
}

WorkflowState WorkflowOrchestrator::state() const {
    std::lock_guard lock(mtx_);
    return state_;
}

std::optional<ClassifiedError> WorkflowOrchestrator::last_error() const {
    std::lock_guard lock(mtx_);
    return last_error_;
}

std::optional<fs::path> WorkflowOrchestrator::result_path() const {
    std::lock_guard lock(mtx_);
    return result_;
}

WorkflowStatus WorkflowOrchestrator::status() const {
    WorkflowStatus out;
    {
        std::lock_guard lock(mtx_);
        out.state = state_;
        out.attempt = attempt_;
        out.result = result_;
        out.error = last_error_;
        if (attempt_ > 0) {
            const auto end = is_in_flight(state_) ? std::chrono::steady_clock::now() : finished_;
            out.elapsed = since(started_, end);
        }
    }
    out.detector_active = detector_.is_watching();
    return out;
}

} // namespace fetchtag
