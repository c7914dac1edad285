//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_REMOTE_TRIGGER_HPP
#define FETCHTAG_REMOTE_TRIGGER_HPP

#include <stop_token>
#include <string>

namespace fetchtag {

/**
 * @brief Whatever drives the third-party conversion site until it starts a download.
 *
 * The orchestrator only sequences it: open() before the run, one
 * perform_remote_conversion(), close() on every exit path.
 */
class IRemoteTrigger {
public:
    virtual ~IRemoteTrigger() = default;

    /// @throws FetchtagError (RemoteAutomationUnavailable) if the automation cannot start.
    virtual void open() = 0;

    /**
     * @brief Ask the remote service to convert @p url and start the browser download.
     *
     * Returns once the download has been started; the file itself is found by
     * the CompletionDetector.
     *
     * @throws FetchtagError RemoteUnreachable, RemoteElementMissing,
     * RemoteAutomationUnavailable or Cancelled.
     */
    virtual void perform_remote_conversion(const std::string& url, std::stop_token st) = 0;

    /// @return false if releasing the automation reported an error. Must be safe to call twice.
    virtual bool close() = 0;
};

} // namespace fetchtag

#endif // FETCHTAG_REMOTE_TRIGGER_HPP
