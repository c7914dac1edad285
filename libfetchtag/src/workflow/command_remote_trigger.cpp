//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/command_remote_trigger.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fetchtag {

namespace {

constexpr auto kTag = "remote_trigger";
constexpr auto kReapInterval = std::chrono::milliseconds(100);
constexpr auto kTermGrace = std::chrono::seconds(2);

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
}

// sleep that wakes up as soon as a stop is requested
bool interruptible_sleep(const std::chrono::milliseconds duration, const std::stop_token& st) {
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock(mtx);
    cv.wait_for(lock, st, duration, [] { return false; });
    return !st.stop_requested();
}

FetchtagError cancelled_error(const std::string& what) {
    return FetchtagError(ErrorKind::Cancelled, Stage::Triggering, what + " cancelled");
}

} // namespace

CommandRemoteTrigger::CommandRemoteTrigger(CommandTriggerSettings settings)
    : settings_(std::move(settings)) {
}

CommandRemoteTrigger::~CommandRemoteTrigger() {
    close();
}

void CommandRemoteTrigger::open() {
    if (settings_.command.empty()) {
        throw FetchtagError(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                            "no automation command configured");
    }
    if (::access("/bin/sh", X_OK) != 0) {
        throw FetchtagError(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                            std::string("/bin/sh is not executable: ") + std::strerror(errno));
    }
    opened_ = true;
    Logger::log(LogLevel::Debug, "Remote trigger ready: " + settings_.command, kTag);
}

std::string CommandRemoteTrigger::expand_command(const std::string& pattern,
                                                 const std::string& url,
                                                 const std::filesystem::path& directory) {
    std::string command = pattern;
    replace_all(command, "{url}", shell_quote(url));
    replace_all(command, "{dir}", shell_quote(directory.string()));
    return command;
}

std::optional<ClassifiedError> CommandRemoteTrigger::classify_exit(const int exit_code) {
    switch (exit_code) {
        case 0:
            return std::nullopt;
        case kExitRemoteUnreachable:
            return ClassifiedError::make(ErrorKind::RemoteUnreachable, Stage::Triggering,
                                         "conversion service unreachable");
        case kExitElementMissing:
            return ClassifiedError::make(ErrorKind::RemoteElementMissing, Stage::Triggering,
                                         "expected control not found on the conversion page");
        case 126:
        case 127:
            return ClassifiedError::make(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                                         "automation command could not be executed (exit " +
                                         std::to_string(exit_code) + ")");
        default:
            return ClassifiedError::make(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                                         "automation command failed with exit code " + std::to_string(exit_code));
    }
}

void CommandRemoteTrigger::perform_remote_conversion(const std::string& url, const std::stop_token st) {
    if (!opened_) {
        throw FetchtagError(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                            "remote trigger used before open()");
    }
    if (st.stop_requested()) throw cancelled_error("remote conversion");

    const std::string command = expand_command(settings_.command, url, settings_.download_directory);
    Logger::log(LogLevel::Info, "Requesting conversion of " + url, kTag);
    Logger::log(LogLevel::Debug, "Running: " + command, kTag);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw FetchtagError(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                            std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        // child: only async-signal-safe calls until exec
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }
    child_ = pid;

    const auto started = std::chrono::steady_clock::now();
    int status = 0;
    for (;;) {
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) break;
        if (rc < 0 && errno != EINTR) {
            const std::string reason = std::strerror(errno);
            child_ = -1;
            throw FetchtagError(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                                "waiting for automation command failed: " + reason);
        }
        if (st.stop_requested()) {
            terminate_child();
            throw cancelled_error("remote conversion");
        }
        if (std::chrono::steady_clock::now() - started > settings_.command_timeout) {
            terminate_child();
            throw FetchtagError(ErrorKind::RemoteUnreachable, Stage::Triggering,
                                "automation command timed out after " +
                                std::to_string(settings_.command_timeout.count()) + " seconds");
        }
        interruptible_sleep(kReapInterval, st);
    }
    child_ = -1;

    if (WIFSIGNALED(status)) {
        throw FetchtagError(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                            "automation command killed by signal " + std::to_string(WTERMSIG(status)));
    }
    const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (const auto error = classify_exit(exit_code)) {
        throw FetchtagError(*error);
    }

    Logger::log(LogLevel::Info, "Download triggered, waiting " + std::to_string(settings_.settle_delay.count()) +
                "s for it to start", kTag);
    if (!interruptible_sleep(settings_.settle_delay, st)) {
        throw cancelled_error("remote conversion");
    }
}

void CommandRemoteTrigger::terminate_child() {
    if (child_ <= 0) return;

    ::kill(child_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    int status = 0;
    while (::waitpid(child_, &status, WNOHANG) == 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::log(LogLevel::Warning, "Automation command ignored SIGTERM, killing it", kTag);
            ::kill(child_, SIGKILL);
            ::waitpid(child_, &status, 0);
            break;
        }
        std::this_thread::sleep_for(kReapInterval);
    }
    child_ = -1;
}

bool CommandRemoteTrigger::close() {
    terminate_child();
    opened_ = false;
    return true;
}

} // namespace fetchtag
