//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file command_remote_trigger.hpp
 * @brief IRemoteTrigger that delegates to an external automation command.
 *
 * The browser automation itself (a Selenium/Playwright script, a headless
 * browser wrapper, ...) lives outside this library. The command is run
 * through /bin/sh with "{url}" and "{dir}" replaced by the shell-quoted
 * source URL and download directory; its exit status is mapped onto the
 * remote error kinds.
 */

#ifndef FETCHTAG_COMMAND_REMOTE_TRIGGER_HPP
#define FETCHTAG_COMMAND_REMOTE_TRIGGER_HPP

#include "classified_error.hpp"
#include "remote_trigger.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace fetchtag {

struct CommandTriggerSettings {
    std::string command;                         ///< e.g. "convert-download --url {url} --out {dir}"
    std::filesystem::path download_directory;
    std::chrono::seconds settle_delay{5};        ///< wait after a successful trigger for the download to begin
    std::chrono::seconds command_timeout{120};
};

// exit codes understood from the automation command
inline constexpr int kExitRemoteUnreachable = 10;
inline constexpr int kExitElementMissing = 11;

class CommandRemoteTrigger : public IRemoteTrigger {
public:
    explicit CommandRemoteTrigger(CommandTriggerSettings settings);
    ~CommandRemoteTrigger() override;

    CommandRemoteTrigger(const CommandRemoteTrigger&) = delete;
    CommandRemoteTrigger& operator=(const CommandRemoteTrigger&) = delete;

    void open() override;
    void perform_remote_conversion(const std::string& url, std::stop_token st) override;
    bool close() override;

    /// @brief "{url}"/"{dir}" substitution with single-quote shell escaping.
    [[nodiscard]] static std::string expand_command(const std::string& pattern,
                                                    const std::string& url,
                                                    const std::filesystem::path& directory);

    /// @brief Map a command exit status to an error; nullopt for 0.
    [[nodiscard]] static std::optional<ClassifiedError> classify_exit(int exit_code);

    [[nodiscard]] const CommandTriggerSettings& settings() const noexcept { return settings_; }

private:
    void terminate_child();

    CommandTriggerSettings settings_;
    bool opened_ = false;
    pid_t child_ = -1;
};

} // namespace fetchtag

#endif // FETCHTAG_COMMAND_REMOTE_TRIGGER_HPP
