//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_CLI_PARSER_HPP
#define FETCHTAG_CLI_PARSER_HPP

#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Fetch,    // full workflow
    Tag,      // tag engine only
    Inspect,  // validation, mime, tags, summary
    Watch     // detector only
};

struct Settings {
    Command command = Command::None;

    bool quiet = false;
    std::string log_level = "WARNING";
    std::filesystem::path log_file = "fetchtag.log";
    std::filesystem::path report_path;

    // watch / workflow configuration
    std::filesystem::path download_dir;
    std::string extension = ".mp3";
    unsigned settle_delay = 5;        // seconds
    unsigned download_timeout = 300;  // seconds
    unsigned poll_ceiling = 30;       // seconds
    unsigned lookback = 10;           // minutes
    std::string trigger_command;
    unsigned command_timeout = 120;   // seconds
    bool auto_retry = false;
    int max_attempts = 3;

    // request
    std::string url;
    std::filesystem::path file;
    std::string artist;
    std::string title;
    std::string album;
    long track = 0;
};

/// @brief ~/Downloads, or ./Downloads when HOME is unset.
std::filesystem::path default_download_dir();

/// @brief ~/.config/fetchtag/fetchtag.toml (XDG_CONFIG_HOME honoured).
std::filesystem::path default_config_path();

/**
 * @brief Configures the CLI11 parser with all subcommands, options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // FETCHTAG_CLI_PARSER_HPP
