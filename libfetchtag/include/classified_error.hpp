//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file classified_error.hpp
 * @brief Error taxonomy shared by the detector, the tag engine and the workflow.
 *
 * Every failure that leaves a fetchtag component is a ClassifiedError: a kind
 * from a closed set, the stage that raised it, a human message and whether a
 * caller may reasonably try again. It travels as the payload of FetchtagError.
 */

#ifndef FETCHTAG_CLASSIFIED_ERROR_HPP
#define FETCHTAG_CLASSIFIED_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fetchtag {

enum class ErrorKind {
    InputValidation,
    RemoteUnreachable,
    RemoteElementMissing,
    RemoteAutomationUnavailable,
    DownloadTimeout,
    FileSystemAccess,
    TagValidationFailed,
    BackupFailed,
    MutationFailed,
    RestoreFailed,          ///< the original file's integrity is uncertain
    WorkflowAlreadyRunning,
    Cancelled
};

enum class Stage {
    Validation,
    Triggering,
    AwaitingFile,
    Mutating,
    Cleanup,
    Orchestration
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

/**
 * @brief Default retryability of a kind.
 *
 * Remote and download problems are worth another attempt; validation,
 * filesystem and tag errors are not going to fix themselves.
 */
[[nodiscard]] bool is_retryable(ErrorKind kind) noexcept;

/// @brief True only for RestoreFailed.
[[nodiscard]] bool is_critical(ErrorKind kind) noexcept;

struct ClassifiedError {
    ErrorKind kind = ErrorKind::MutationFailed;
    std::string message;
    bool retryable = false;
    Stage stage = Stage::Orchestration;

    /// @brief Build an error with the kind's default retryability.
    static ClassifiedError make(ErrorKind kind, Stage stage, std::string message);

    /// @return Text suitable for a status line ("Download Error: ...").
    [[nodiscard]] std::string user_message() const;

    /// @return Short list of things the user can do about it.
    [[nodiscard]] std::vector<std::string> suggested_actions() const;

    /// @return "[stage] kind: message", used for logging.
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Decide whether an automatic retry loop should try again.
 *
 * Stricter than ClassifiedError::retryable: only network and element-location
 * failures qualify, and never once @p attempt has reached @p max_attempts.
 */
[[nodiscard]] bool should_retry(const ClassifiedError& error, int attempt, int max_attempts = 3) noexcept;

/**
 * @brief Exception carrying a ClassifiedError.
 *
 * what() returns the describe() text so that a plain std::exception handler
 * still logs something meaningful.
 */
class FetchtagError : public std::runtime_error {
public:
    explicit FetchtagError(ClassifiedError error);
    FetchtagError(ErrorKind kind, Stage stage, std::string message);

    [[nodiscard]] const ClassifiedError& error() const noexcept { return error_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return error_.kind; }

private:
    ClassifiedError error_;
};

} // namespace fetchtag

#endif // FETCHTAG_CLASSIFIED_ERROR_HPP
