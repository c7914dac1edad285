//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file completion_detector.hpp
 * @brief Finds the one new file in a download directory that has finished writing.
 *
 * An inotify observer thread records every matching file that appears and
 * pushes it into a channel. The caller's thread then polls each candidate once
 * per interval: three unchanged, non-zero sizes in a row followed by a valid
 * MPEG/ID3 header mean the browser is done with it.
 */

#ifndef FETCHTAG_COMPLETION_DETECTOR_HPP
#define FETCHTAG_COMPLETION_DETECTOR_HPP

#include "classified_error.hpp"
#include "detected_file_set.hpp"
#include "event_channel.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace fetchtag {

class EventBus;

/**
 * @brief Directory and extension observed by one monitoring session.
 */
struct WatchTarget {
    std::filesystem::path directory;
    std::string extension = ".mp3";
};

/**
 * @brief Token returned by start_watching(); equal handles mean the same session.
 */
struct WatchHandle {
    std::uint64_t id = 0;
    std::filesystem::path directory;
    std::string extension;

    bool operator==(const WatchHandle&) const = default;
};

struct DetectorSettings {
    std::chrono::milliseconds poll_interval{1000};
    int stable_polls_required = 3;
    std::chrono::seconds poll_ceiling{30};      ///< per-candidate stabilization budget
    std::chrono::seconds modify_window{300};    ///< modified-but-unseen files younger than this count as new
    unsigned drain_threads = 4;                 ///< workers for completed_candidates()
};

enum class StabilizationStatus {
    Pending,
    Stable,
    Failed
};

/**
 * @brief Size-stability + header state machine for one candidate.
 *
 * poll() is called once per poll interval by the owner; it never sleeps.
 */
class Stabilizer {
public:
    Stabilizer(std::filesystem::path path, const DetectorSettings& settings);

    /**
     * @brief Take one size sample and advance.
     * @return Stable once the file passed, Failed once it cannot pass anymore.
     */
    StabilizationStatus poll();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::optional<ClassifiedError>& error() const noexcept { return error_; }
    [[nodiscard]] std::uintmax_t last_size() const noexcept { return last_size_ < 0 ? 0 : static_cast<std::uintmax_t>(last_size_); }
    [[nodiscard]] int polls() const noexcept { return polls_; }
    [[nodiscard]] int stable_count() const noexcept { return stable_count_; }

private:
    StabilizationStatus fail(ErrorKind kind, std::string message);
    [[nodiscard]] bool final_attempt() const noexcept { return polls_ >= max_polls_; }

    std::filesystem::path path_;
    int required_;
    int max_polls_;
    std::chrono::seconds ceiling_;
    long long last_size_ = -1;
    int stable_count_ = 0;
    int polls_ = 0;
    std::optional<ClassifiedError> error_;
};

class CompletionDetector {
public:
    explicit CompletionDetector(DetectorSettings settings = {}, EventBus* bus = nullptr);
    ~CompletionDetector();

    CompletionDetector(const CompletionDetector&) = delete;
    CompletionDetector& operator=(const CompletionDetector&) = delete;

    /**
     * @brief Begin observing @p target.
     *
     * Idempotent: while a session is active the existing handle is returned
     * and @p target is ignored.
     *
     * @throws FetchtagError (FileSystemAccess) if the directory is missing,
     * fails the write probe, or cannot be watched.
     */
    WatchHandle start_watching(const WatchTarget& target);

    /**
     * @brief Wait for the first candidate to stabilize.
     *
     * Candidates that fail on the way are logged, published and kept in
     * candidate_errors(); waiting continues with the others.
     *
     * @return The stable file, or nullopt if @p timeout elapsed or @p st was triggered.
     * @throws FetchtagError (FileSystemAccess) if no session is active.
     */
    [[nodiscard]] std::optional<std::filesystem::path> await_new_file(std::chrono::milliseconds timeout,
                                                                      std::stop_token st = {});

    /**
     * @brief await_new_file(), then the recent_files() fallback when nothing stabilized.
     *
     * A file found by the scan is not re-checked for completeness. Nothing
     * is scanned once @p st was triggered.
     *
     * @return The stable file, else the newest recent one, else nullopt.
     * @throws FetchtagError (FileSystemAccess) if no session is active.
     */
    [[nodiscard]] std::optional<std::filesystem::path> await_new_file_or_recent(std::chrono::milliseconds timeout,
                                                                                std::chrono::seconds lookback,
                                                                                std::stop_token st = {});

    /**
     * @brief Fallback scan: matching files whose change time is within @p lookback.
     *
     * Works on the last target even after stop_watching(). Found files are
     * recorded in the detected set like event-reported ones.
     *
     * @return Newest first; empty if no target was ever set or the directory is unreadable.
     */
    [[nodiscard]] std::vector<std::filesystem::path> recent_files(std::chrono::seconds lookback);

    /**
     * @brief Stabilize a single file on the calling thread.
     * @return true when stable, false if @p st was triggered first.
     * @throws FetchtagError on a definitive failure.
     */
    bool wait_for_completion(const std::filesystem::path& path, std::stop_token st = {});

    /**
     * @brief Stabilize every pending candidate concurrently.
     * @return Files that stabilized during this call, in detection order.
     */
    [[nodiscard]] std::vector<std::filesystem::path> completed_candidates(std::stop_token st = {});

    /**
     * @brief End the session: stop the observer, release the inotify watch, clear bookkeeping.
     *
     * Safe to call any number of times.
     * @return false if releasing the watch reported an error.
     */
    bool stop_watching();

    [[nodiscard]] bool is_watching() const;
    [[nodiscard]] std::optional<WatchTarget> target() const;
    [[nodiscard]] std::vector<ClassifiedError> candidate_errors() const;
    [[nodiscard]] const DetectorSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] const DetectedFileSet& detected() const noexcept { return detected_; }

private:
    void observer_loop(const std::stop_token& st, int fd, std::filesystem::path directory, std::string extension);
    void on_fs_event(const std::filesystem::path& path, std::uint32_t mask, const std::string& extension);
    void record_candidate_failure(const std::filesystem::path& path, const ClassifiedError& error);
    void record_stable(const Stabilizer& stabilizer, std::chrono::steady_clock::time_point started);

    DetectorSettings settings_;
    EventBus* bus_;

    DetectedFileSet detected_;
    EventChannel<std::filesystem::path> channel_;
    ThreadPool pool_;

    mutable std::mutex state_mtx_;
    std::optional<WatchTarget> target_;
    WatchHandle handle_;
    std::uint64_t next_id_ = 1;
    int inotify_fd_ = -1;
    int watch_descriptor_ = -1;
    std::jthread observer_;
    std::atomic<bool> active_{false};

    mutable std::mutex errors_mtx_;
    std::vector<ClassifiedError> candidate_errors_;
};

} // namespace fetchtag

#endif // FETCHTAG_COMPLETION_DETECTOR_HPP
