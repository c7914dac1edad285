//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/completion_detector.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/header_signature.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <future>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace fetchtag {

namespace {

constexpr auto kTag = "detector";
constexpr int kObserverPollMs = 200;
constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO;

int max_polls_for(const DetectorSettings& s) {
    const auto interval = std::max<std::chrono::milliseconds::rep>(s.poll_interval.count(), 1);
    const auto ceiling_ms = std::chrono::duration_cast<std::chrono::milliseconds>(s.poll_ceiling).count();
    const auto polls = static_cast<int>(ceiling_ms / interval);
    // at least enough samples to ever reach the stability threshold
    return std::max(polls, s.stable_polls_required + 1);
}

fs::path absolute_or_same(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

} // namespace

// ---------------------------------------------------------------- Stabilizer

Stabilizer::Stabilizer(fs::path path, const DetectorSettings& settings)
    : path_(std::move(path)),
      required_(std::max(settings.stable_polls_required, 1)),
      max_polls_(max_polls_for(settings)),
      ceiling_(settings.poll_ceiling) {
}

StabilizationStatus Stabilizer::fail(const ErrorKind kind, std::string message) {
    error_ = ClassifiedError::make(kind, Stage::AwaitingFile, std::move(message));
    return StabilizationStatus::Failed;
}

StabilizationStatus Stabilizer::poll() {
    if (error_) return StabilizationStatus::Failed;
    ++polls_;

    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (ec) {
        stable_count_ = 0;
        if (last_size_ >= 0 && ec == std::errc::no_such_file_or_directory) {
            return fail(ErrorKind::FileSystemAccess,
                        "file disappeared while downloading: " + path_.filename().string());
        }
        if (final_attempt()) {
            return fail(ErrorKind::FileSystemAccess,
                        "cannot read size of " + path_.filename().string() + ": " + ec.message());
        }
        Logger::log(LogLevel::Debug, "Size probe failed for " + path_.filename().string() + ", retrying: " + ec.message(), kTag);
        return StabilizationStatus::Pending;
    }

    const auto current = static_cast<long long>(size);
    if (current > 0 && current == last_size_) {
        ++stable_count_;
    } else {
        stable_count_ = 0;
    }
    last_size_ = current;

    if (stable_count_ >= required_) {
        const auto sig = read_header_signature(path_, ec);
        if (!ec && is_known_signature(sig)) {
            return StabilizationStatus::Stable;
        }
        if (ec) {
            Logger::log(LogLevel::Debug, "Header read failed for " + path_.filename().string() + ": " + ec.message(), kTag);
        } else {
            Logger::log(LogLevel::Debug, "No MPEG/ID3 header yet in " + path_.filename().string(), kTag);
        }
        stable_count_ = 0;
        if (final_attempt()) {
            return fail(ErrorKind::FileSystemAccess,
                        ec ? "cannot read header of " + path_.filename().string() + ": " + ec.message()
                           : "not an MPEG audio file: " + path_.filename().string());
        }
        return StabilizationStatus::Pending;
    }

    if (final_attempt()) {
        return fail(ErrorKind::DownloadTimeout,
                    path_.filename().string() + " did not stabilize within " +
                    std::to_string(ceiling_.count()) + " seconds");
    }
    return StabilizationStatus::Pending;
}

// -------------------------------------------------------- CompletionDetector

CompletionDetector::CompletionDetector(DetectorSettings settings, EventBus* bus)
    : settings_(settings),
      bus_(bus),
      pool_(settings.drain_threads) {
}

CompletionDetector::~CompletionDetector() {
    stop_watching();
}

WatchHandle CompletionDetector::start_watching(const WatchTarget& target) {
    std::lock_guard lock(state_mtx_);
    if (active_.load()) {
        Logger::log(LogLevel::Debug, "Already watching " + handle_.directory.string(), kTag);
        return handle_;
    }

    const fs::path dir = absolute_or_same(target.directory);
    std::error_code ec;
    if (!fs::exists(dir, ec) || !fs::is_directory(dir, ec)) {
        throw FetchtagError(ErrorKind::FileSystemAccess, Stage::AwaitingFile,
                            "download directory does not exist: " + dir.string());
    }
    if (!probe_directory_access(dir, ec)) {
        throw FetchtagError(ErrorKind::FileSystemAccess, Stage::AwaitingFile,
                            "download directory is not writable: " + dir.string() +
                            (ec ? " (" + ec.message() + ")" : std::string{}));
    }

    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw FetchtagError(ErrorKind::FileSystemAccess, Stage::AwaitingFile,
                            std::string("cannot create inotify instance: ") + std::strerror(errno));
    }
    const int wd = ::inotify_add_watch(fd, dir.c_str(), kWatchMask);
    if (wd < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw FetchtagError(ErrorKind::FileSystemAccess, Stage::AwaitingFile,
                            "cannot watch " + dir.string() + ": " + reason);
    }

    detected_.clear();
    channel_.reset();
    {
        std::lock_guard elock(errors_mtx_);
        candidate_errors_.clear();
    }

    std::string extension = target.extension.empty() ? std::string(".mp3") : target.extension;
    target_ = WatchTarget{dir, extension};
    handle_ = WatchHandle{next_id_++, dir, extension};
    inotify_fd_ = fd;
    watch_descriptor_ = wd;
    active_.store(true);

    observer_ = std::jthread([this, fd, dir, extension](const std::stop_token& st) {
        observer_loop(st, fd, dir, extension);
    });

    Logger::log(LogLevel::Info, "Watching " + dir.string() + " for *" + extension, kTag);
    return handle_;
}

void CompletionDetector::observer_loop(const std::stop_token& st, const int fd, const fs::path directory,
                                       const std::string extension) {
    alignas(inotify_event) std::array<char, 4096> buffer{};

    while (!st.stop_requested()) {
        pollfd pfd{fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, kObserverPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::log(LogLevel::Error, std::string("inotify poll failed: ") + std::strerror(errno), kTag);
            return;
        }
        if (rc == 0) continue;

        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            Logger::log(LogLevel::Error, std::string("inotify read failed: ") + std::strerror(errno), kTag);
            return;
        }

        for (const char* ptr = buffer.data(); ptr < buffer.data() + n;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(ptr);
            if (ev->mask & IN_Q_OVERFLOW) {
                Logger::log(LogLevel::Warning, "inotify queue overflowed; some events were lost", kTag);
            }
            if (ev->mask & IN_IGNORED) {
                Logger::log(LogLevel::Warning, "Watch on " + directory.string() + " was removed", kTag);
            }
            if (ev->len > 0 && !(ev->mask & IN_ISDIR)) {
                on_fs_event(directory / ev->name, ev->mask, extension);
            }
            ptr += sizeof(inotify_event) + ev->len;
        }
    }
}

void CompletionDetector::on_fs_event(const fs::path& path, const std::uint32_t mask, const std::string& extension) {
    if (!has_extension(path, extension)) return;

    if (!(mask & (IN_CREATE | IN_MOVED_TO))) {
        // a modify on an unseen file: only accept it if the file is recent
        if (detected_.contains(path)) return;
        const auto changed = change_time(path);
        if (!changed || std::chrono::system_clock::now() - *changed > settings_.modify_window) return;
    }

    if (detected_.insert(path)) {
        Logger::log(LogLevel::Info, "Detected " + path.filename().string(), kTag);
        if (bus_) bus_->publish(FileDetectedEvent{path});
        channel_.push(path);
    }
}

std::optional<fs::path> CompletionDetector::await_new_file(const std::chrono::milliseconds timeout,
                                                           const std::stop_token st) {
    if (!active_.load()) {
        throw FetchtagError(ErrorKind::FileSystemAccess, Stage::AwaitingFile,
                            "await_new_file called without an active watch");
    }

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    auto next_poll = started;
    std::vector<Stabilizer> trackers;

    const auto track = [&](const fs::path& p) {
        const bool known = std::ranges::any_of(trackers, [&](const Stabilizer& s) { return s.path() == p; });
        if (!known && !detected_.find(p).value_or(DetectedFile{}).stabilized) {
            trackers.emplace_back(p, settings_);
        }
    };

    // candidates recorded before this call are still eligible
    for (const auto& p : detected_.pending()) track(p);

    while (!st.stop_requested()) {
        for (const auto& p : channel_.drain()) {
            if (detected_.contains(p)) track(p);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_poll) {
            for (auto it = trackers.begin(); it != trackers.end();) {
                const auto status = it->poll();
                if (status == StabilizationStatus::Stable) {
                    record_stable(*it, started);
                    return it->path();
                }
                if (status == StabilizationStatus::Failed) {
                    record_candidate_failure(it->path(), *it->error());
                    it = trackers.erase(it);
                    continue;
                }
                ++it;
            }
            now = std::chrono::steady_clock::now();
            // a slow round must not turn into back-to-back samples
            next_poll = std::max(next_poll + settings_.poll_interval, now + settings_.poll_interval);
        }

        if (now >= deadline) break;

        const auto wake = std::min(next_poll, deadline);
        if (wake > now) {
            if (auto p = channel_.pop_for(wake - now, st)) {
                if (detected_.contains(*p)) track(*p);
            }
        }
    }

    if (st.stop_requested()) {
        Logger::log(LogLevel::Debug, "Wait for new file cancelled", kTag);
    } else {
        Logger::log(LogLevel::Warning, "No completed file within " +
                    std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) + " seconds", kTag);
    }
    return std::nullopt;
}

void CompletionDetector::record_stable(const Stabilizer& stabilizer, const std::chrono::steady_clock::time_point started) {
    detected_.mark_stabilized(stabilizer.path());
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::log(LogLevel::Info, "Download complete: " + stabilizer.path().filename().string() +
                " (" + human_size(stabilizer.last_size()) + ")", kTag);
    if (bus_) bus_->publish(FileStabilizedEvent{stabilizer.path(), stabilizer.last_size(), waited});
}

void CompletionDetector::record_candidate_failure(const fs::path& path, const ClassifiedError& error) {
    Logger::log(LogLevel::Warning, "Candidate " + path.filename().string() + " dropped: " + error.message, kTag);
    detected_.erase(path);
    {
        std::lock_guard lock(errors_mtx_);
        candidate_errors_.push_back(error);
    }
    if (bus_) bus_->publish(CandidateFailedEvent{path, error});
}

std::optional<fs::path> CompletionDetector::await_new_file_or_recent(const std::chrono::milliseconds timeout,
                                                                    const std::chrono::seconds lookback,
                                                                    const std::stop_token st) {
    auto file = await_new_file(timeout, st);
    if (file || st.stop_requested()) return file;

    Logger::log(LogLevel::Warning, "No completed download reported, scanning recent files", kTag);
    const auto recent = recent_files(lookback);
    if (recent.empty()) return std::nullopt;

    Logger::log(LogLevel::Warning, "Using most recent file " + recent.front().filename().string() +
                " (not re-checked for completeness)", kTag);
    return recent.front();
}

std::vector<fs::path> CompletionDetector::recent_files(const std::chrono::seconds lookback) {
    const auto current = target();
    if (!current) return {};

    std::vector<std::pair<std::chrono::system_clock::time_point, fs::path>> found;
    const auto now = std::chrono::system_clock::now();

    std::error_code ec;
    fs::directory_iterator it(current->directory, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Fallback scan cannot list " + current->directory.string() + ": " + ec.message(), kTag);
        return {};
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Fallback scan stopped early: " + ec.message(), kTag);
            break;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec) || !has_extension(it->path(), current->extension)) continue;
        const auto changed = change_time(it->path());
        if (!changed || now - *changed > lookback) continue;
        found.emplace_back(*changed, it->path());
    }

    std::ranges::sort(found, std::greater<>{}, &std::pair<std::chrono::system_clock::time_point, fs::path>::first);

    std::vector<fs::path> out;
    out.reserve(found.size());
    for (auto& [when, p] : found) {
        detected_.insert(p);
        out.push_back(std::move(p));
    }
    Logger::log(LogLevel::Debug, "Fallback scan found " + std::to_string(out.size()) + " recent file(s)", kTag);
    return out;
}

bool CompletionDetector::wait_for_completion(const fs::path& path, const std::stop_token st) {
    Stabilizer stabilizer(path, settings_);
    std::mutex mtx;
    std::condition_variable_any cv;

    for (;;) {
        switch (stabilizer.poll()) {
            case StabilizationStatus::Stable:
                return true;
            case StabilizationStatus::Failed:
                throw FetchtagError(*stabilizer.error());
            case StabilizationStatus::Pending:
                break;
        }
        std::unique_lock lock(mtx);
        cv.wait_for(lock, st, settings_.poll_interval, [] { return false; });
        if (st.stop_requested()) return false;
    }
}

std::vector<fs::path> CompletionDetector::completed_candidates(const std::stop_token st) {
    const auto candidates = detected_.pending();
    if (candidates.empty()) return {};

    const auto started = std::chrono::steady_clock::now();
    std::stop_source drain_stop;
    std::stop_callback relay(st, [&drain_stop] { drain_stop.request_stop(); });

    std::vector<std::future<bool>> futures;
    futures.reserve(candidates.size());

    // queued tasks hold drain_stop; they must be finished before it goes away
    struct DrainGuard {
        std::stop_source& stop;
        std::vector<std::future<bool>>& pending;
        ~DrainGuard() {
            for (auto& f : pending) {
                if (!f.valid()) continue;
                stop.request_stop();
                f.wait();
            }
        }
    } guard{drain_stop, futures};

    for (const auto& p : candidates) {
        futures.push_back(pool_.enqueue([this, p, &drain_stop](const std::stop_token& worker_st) {
            std::stop_callback worker_relay(worker_st, [&drain_stop] { drain_stop.request_stop(); });
            return wait_for_completion(p, drain_stop.get_token());
        }));
    }

    std::vector<fs::path> completed;
    for (std::size_t i = 0; i < futures.size(); ++i) {
        try {
            if (futures[i].get()) {
                std::error_code ec;
                const auto size = fs::file_size(candidates[i], ec);
                detected_.mark_stabilized(candidates[i]);
                const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
                Logger::log(LogLevel::Info, "Download complete: " + candidates[i].filename().string(), kTag);
                if (bus_) bus_->publish(FileStabilizedEvent{candidates[i], ec ? 0 : size, waited});
                completed.push_back(candidates[i]);
            }
        } catch (const FetchtagError& e) {
            record_candidate_failure(candidates[i], e.error());
        } catch (const std::future_error& e) {
            Logger::log(LogLevel::Warning, "Stabilization task for " + candidates[i].filename().string() +
                        " was discarded: " + e.what(), kTag);
        } catch (const std::exception& e) {
            record_candidate_failure(candidates[i], ClassifiedError::make(
                ErrorKind::FileSystemAccess, Stage::AwaitingFile,
                "stabilizing " + candidates[i].filename().string() + " failed: " + e.what()));
        }
    }
    return completed;
}

bool CompletionDetector::stop_watching() {
    std::lock_guard lock(state_mtx_);
    if (!active_.exchange(false)) return true;

    if (observer_.joinable()) {
        observer_.request_stop();
        observer_.join();
    }
    channel_.close();

    bool clean = true;
    if (watch_descriptor_ >= 0 && ::inotify_rm_watch(inotify_fd_, watch_descriptor_) != 0) {
        // EINVAL means the kernel already dropped the watch (directory deleted)
        if (errno != EINVAL) {
            Logger::log(LogLevel::Warning, std::string("inotify_rm_watch failed: ") + std::strerror(errno), kTag);
            clean = false;
        }
    }
    if (inotify_fd_ >= 0 && ::close(inotify_fd_) != 0) {
        Logger::log(LogLevel::Warning, std::string("closing inotify descriptor failed: ") + std::strerror(errno), kTag);
        clean = false;
    }
    inotify_fd_ = -1;
    watch_descriptor_ = -1;
    detected_.clear();

    Logger::log(LogLevel::Info, "Stopped watching " + handle_.directory.string(), kTag);
    return clean;
}

bool CompletionDetector::is_watching() const {
    return active_.load();
}

std::optional<WatchTarget> CompletionDetector::target() const {
    std::lock_guard lock(state_mtx_);
    return target_;
}

std::vector<ClassifiedError> CompletionDetector::candidate_errors() const {
    std::lock_guard lock(errors_mtx_);
    return candidate_errors_;
}

} // namespace fetchtag
