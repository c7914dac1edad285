//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/classified_error.hpp"
#include <utility>

namespace fetchtag {

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InputValidation:             return "InputValidation";
        case ErrorKind::RemoteUnreachable:           return "RemoteUnreachable";
        case ErrorKind::RemoteElementMissing:        return "RemoteElementMissing";
        case ErrorKind::RemoteAutomationUnavailable: return "RemoteAutomationUnavailable";
        case ErrorKind::DownloadTimeout:             return "DownloadTimeout";
        case ErrorKind::FileSystemAccess:            return "FileSystemAccess";
        case ErrorKind::TagValidationFailed:         return "TagValidationFailed";
        case ErrorKind::BackupFailed:                return "BackupFailed";
        case ErrorKind::MutationFailed:              return "MutationFailed";
        case ErrorKind::RestoreFailed:               return "RestoreFailed";
        case ErrorKind::WorkflowAlreadyRunning:      return "WorkflowAlreadyRunning";
        case ErrorKind::Cancelled:                   return "Cancelled";
    }
    return "Unknown";
}

std::string_view to_string(const Stage stage) noexcept {
    switch (stage) {
        case Stage::Validation:    return "validation";
        case Stage::Triggering:    return "triggering";
        case Stage::AwaitingFile:  return "awaiting-file";
        case Stage::Mutating:      return "mutating";
        case Stage::Cleanup:       return "cleanup";
        case Stage::Orchestration: return "orchestration";
    }
    return "unknown";
}

bool is_retryable(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::RemoteUnreachable:
        case ErrorKind::RemoteElementMissing:
        case ErrorKind::DownloadTimeout:
        case ErrorKind::Cancelled:
            return true;
        default:
            return false;
    }
}

bool is_critical(const ErrorKind kind) noexcept {
    return kind == ErrorKind::RestoreFailed;
}

ClassifiedError ClassifiedError::make(const ErrorKind kind, const Stage stage, std::string message) {
    ClassifiedError e;
    e.kind = kind;
    e.stage = stage;
    e.message = std::move(message);
    e.retryable = is_retryable(kind);
    return e;
}

std::string ClassifiedError::user_message() const {
    switch (kind) {
        case ErrorKind::InputValidation:
            return "Input Error: " + message;
        case ErrorKind::RemoteUnreachable:
            return "Network Connection Error: Unable to reach the conversion service. "
                   "Please check your internet connection and try again. (" + message + ")";
        case ErrorKind::RemoteElementMissing:
            return "Website Error: The conversion service appears to have changed. " + message;
        case ErrorKind::RemoteAutomationUnavailable:
            return "Automation Error: " + message;
        case ErrorKind::DownloadTimeout:
        case ErrorKind::FileSystemAccess:
            return "Download Error: " + message;
        case ErrorKind::TagValidationFailed:
        case ErrorKind::BackupFailed:
        case ErrorKind::MutationFailed:
            return "Metadata Error: " + message;
        case ErrorKind::RestoreFailed:
            return "CRITICAL: the original file could not be restored and may be damaged. "
                   "A backup copy was left next to it. " + message;
        case ErrorKind::WorkflowAlreadyRunning:
            return "A download is already in progress. Please wait for it to complete.";
        case ErrorKind::Cancelled:
            return "Operation cancelled.";
    }
    return "Unexpected Error: " + message;
}

std::vector<std::string> ClassifiedError::suggested_actions() const {
    switch (kind) {
        case ErrorKind::InputValidation:
            return {"Please correct the input and try again",
                    "Ensure all required fields are filled out properly"};
        case ErrorKind::RemoteUnreachable:
            return {"Check your internet connection",
                    "Try again in a few moments",
                    "Verify that the conversion service is reachable"};
        case ErrorKind::RemoteElementMissing:
            return {"Try again in a few minutes",
                    "The service may have been updated; update the automation command"};
        case ErrorKind::RemoteAutomationUnavailable:
            return {"Check that the automation command is installed and executable",
                    "Run the command by hand to see its output"};
        case ErrorKind::DownloadTimeout:
        case ErrorKind::FileSystemAccess:
            return {"Check that you have sufficient disk space",
                    "Ensure the download folder is accessible",
                    "Try the download again"};
        case ErrorKind::TagValidationFailed:
        case ErrorKind::BackupFailed:
        case ErrorKind::MutationFailed:
            return {"Ensure the MP3 file is not corrupted",
                    "Check that the file is not being used by another application"};
        case ErrorKind::RestoreFailed:
            return {"Do not delete the .backup file next to the target",
                    "Copy the backup over the damaged file by hand"};
        case ErrorKind::WorkflowAlreadyRunning:
            return {"Wait for the current download to finish or cancel it"};
        case ErrorKind::Cancelled:
            return {"Start the download again when ready"};
    }
    return {"Try again", "Report the problem if it persists"};
}

std::string ClassifiedError::describe() const {
    std::string out = "[";
    out += to_string(stage);
    out += "] ";
    out += to_string(kind);
    out += ": ";
    out += message;
    return out;
}

bool should_retry(const ClassifiedError& error, const int attempt, const int max_attempts) noexcept {
    if (attempt >= max_attempts) return false;
    return error.kind == ErrorKind::RemoteUnreachable ||
           error.kind == ErrorKind::RemoteElementMissing;
}

FetchtagError::FetchtagError(ClassifiedError error)
    : std::runtime_error(error.describe()), error_(std::move(error)) {}

FetchtagError::FetchtagError(const ErrorKind kind, const Stage stage, std::string message)
    : FetchtagError(ClassifiedError::make(kind, stage, std::move(message))) {}

} // namespace fetchtag
