//
// Created by Giuseppe Francione on 16/10/26.
//

#include "cli_parser.hpp"
#include "../../../libfetchtag/include/metadata_fields.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fs = std::filesystem;

namespace {
// helper for validating the source url
struct SourceUrlValidator : CLI::Validator {
    SourceUrlValidator() {
        name_ = "URL";
        func_ = [](const std::string& str) {
            if (!fetchtag::is_supported_source_url(str)) {
                return std::string("Unsupported URL: '") + str +
                       "'. Expected a youtube.com/watch?v=, youtu.be/, /embed/ or /v/ link.";
            }
            return std::string(); // ok
        };
    }
};

void add_field_options(CLI::App* cmd, Settings& settings) {
    cmd->add_option("-a,--artist", settings.artist, "Artist name.")->required();
    cmd->add_option("-t,--title", settings.title, "Track title.")->required();
    cmd->add_option("-A,--album", settings.album, "Album name.")->required();
    cmd->add_option("-n,--track", settings.track, "Track number.")
        ->required()
        ->check(CLI::PositiveNumber);
}
} // namespace

fs::path default_download_dir() {
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / "Downloads";
}

fs::path default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "fetchtag" / "fetchtag.toml";
    }
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config" / "fetchtag" / "fetchtag.toml";
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // options below may also come from the config file (toml or ini)
    app.set_config("--config", default_config_path().string(),
                   "Read options from a TOML/INI file.");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, report).");

    app.add_option("--log-level", settings.log_level,
                   "Console log level: ERROR, WARNING, INFO, DEBUG.")
                   ->default_val("WARNING")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Log file (always written at DEBUG level).")
                   ->default_val("fetchtag.log");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    settings.download_dir = default_download_dir();
    app.add_option("-d,--download-dir", settings.download_dir,
                   "Directory the browser downloads into.")
                   ->default_val(settings.download_dir.string());

    app.add_option("--extension", settings.extension,
                   "Extension of the expected download.")
                   ->default_val(".mp3");

    app.add_option("--settle-delay", settings.settle_delay,
                   "Seconds to wait after triggering before watching.")
                   ->default_val(5);

    app.add_option("--download-timeout", settings.download_timeout,
                   "Seconds to wait for the download to complete.")
                   ->default_val(300)
                   ->check(CLI::PositiveNumber);

    app.add_option("--poll-ceiling", settings.poll_ceiling,
                   "Seconds a single file may take to stabilize.")
                   ->default_val(30)
                   ->check(CLI::Range(4u, 3600u));

    app.add_option("--lookback", settings.lookback,
                   "Minutes of recent files considered by the fallback scan.")
                   ->default_val(10)
                   ->check(CLI::PositiveNumber);

    // --- fetch ---
    auto* fetch = app.add_subcommand("fetch", "Trigger the remote conversion, wait for the download and tag it.");
    fetch->add_option("url", settings.url, "Video URL to convert.")
        ->required()
        ->check(SourceUrlValidator());
    add_field_options(fetch, settings);
    fetch->add_option("--trigger-command", settings.trigger_command,
                      "Automation command; {url} and {dir} are substituted.")
        ->required();
    fetch->add_option("--command-timeout", settings.command_timeout,
                      "Seconds the automation command may run.")
        ->default_val(120)
        ->check(CLI::PositiveNumber);
    fetch->add_flag("--retry", settings.auto_retry,
                    "Retry automatically when the failure is retryable.");
    fetch->add_option("--max-attempts", settings.max_attempts,
                      "Upper bound on attempts when retrying.")
        ->default_val(3)
        ->check(CLI::Range(1, 10));
    fetch->callback([&settings] { settings.command = Command::Fetch; });

    // --- tag ---
    auto* tag = app.add_subcommand("tag", "Apply artist/title/album/track to an existing file.");
    tag->add_option("file", settings.file, "MP3 file to tag.")
        ->required()
        ->check(CLI::ExistingFile);
    add_field_options(tag, settings);
    tag->callback([&settings] { settings.command = Command::Tag; });

    // --- inspect ---
    auto* inspect = app.add_subcommand("inspect", "Validate a file and print its type and tags.");
    inspect->add_option("file", settings.file, "File to inspect.")
        ->required()
        ->check(CLI::ExistingFile);
    inspect->callback([&settings] { settings.command = Command::Inspect; });

    // --- watch ---
    auto* watch = app.add_subcommand("watch", "Wait for the next completed download and print its path.");
    watch->callback([&settings] { settings.command = Command::Watch; });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.extension.empty()) {
            throw CLI::ValidationError("--extension must not be empty.");
        }
        if (settings.command != Command::Inspect && settings.command != Command::Tag &&
            !std::filesystem::is_directory(settings.download_dir)) {
            throw CLI::ValidationError("Download directory '" + settings.download_dir.string() + "' not found.");
        }
    });
}
