//
// Created by Giuseppe Francione on 16/10/26.
//

#include <iostream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <clocale>
#include <optional>
#include <vector>
#include <chrono>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/console_progress_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libfetchtag/include/command_remote_trigger.hpp"
#include "../../libfetchtag/include/completion_detector.hpp"
#include "../../libfetchtag/include/event_bus.hpp"
#include "../../libfetchtag/include/events.hpp"
#include "../../libfetchtag/include/file_utils.hpp"
#include "../../libfetchtag/include/logger.hpp"
#include "../../libfetchtag/include/mime_detector.hpp"
#include "../../libfetchtag/include/tag_mutation_engine.hpp"
#include "../../libfetchtag/include/workflow_orchestrator.hpp"

using namespace fetchtag;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCritical = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the main thread does the actual cancelling
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII tags may be problematic.",
                "LocaleInit");
}

int exit_code_for(const ClassifiedError& error) {
    if (error.kind == ErrorKind::RestoreFailed) return kExitCritical;
    if (error.kind == ErrorKind::Cancelled) return kExitInterrupted;
    return kExitFailure;
}

void print_error(const ClassifiedError& error) {
    std::cerr << RED << "\n" << (is_critical(error.kind) ? "CRITICAL: " : "Error: ")
              << error.user_message() << RESET << "\n  " << error.message << std::endl;
    for (const auto& action : error.suggested_actions()) {
        std::cerr << "  - " << action << std::endl;
    }
}

MetadataFields fields_from(const Settings& settings) {
    return MetadataFields{settings.artist, settings.title, settings.album, settings.track};
}

DetectorSettings detector_settings_from(const Settings& settings) {
    DetectorSettings ds;
    ds.poll_ceiling = std::chrono::seconds(settings.poll_ceiling);
    return ds;
}

int run_fetch(const Settings& settings, std::vector<Result>& results) {
    EventBus bus;

    CommandTriggerSettings trigger_settings;
    trigger_settings.command = settings.trigger_command;
    trigger_settings.download_directory = settings.download_dir;
    trigger_settings.settle_delay = std::chrono::seconds(settings.settle_delay);
    trigger_settings.command_timeout = std::chrono::seconds(settings.command_timeout);
    CommandRemoteTrigger trigger(trigger_settings);

    CompletionDetector detector(detector_settings_from(settings), &bus);
    TagEngineSettings engine_settings;
    engine_settings.extension = settings.extension;
    TagMutationEngine engine(engine_settings, &bus);

    WorkflowSettings workflow_settings;
    workflow_settings.watch = WatchTarget{settings.download_dir, settings.extension};
    workflow_settings.download_timeout = std::chrono::seconds(settings.download_timeout);
    workflow_settings.fallback_lookback = std::chrono::minutes(settings.lookback);
    workflow_settings.max_retry_attempts = settings.max_attempts;

    ConsoleProgressSink progress;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_settings, bus,
                                      settings.quiet ? nullptr : &progress);

    bus.subscribe<FileDetectedEvent>([&](const FileDetectedEvent& e) {
        Logger::log(LogLevel::Info, "Download appeared: " + e.path.filename().string(), "main");
    });
    bus.subscribe<CandidateFailedEvent>([&](const CandidateFailedEvent& e) {
        Logger::log(LogLevel::Warning, e.path.filename().string() + " " + e.error.message, "main");
    });
    bus.subscribe<MutationRolledBackEvent>([&](const MutationRolledBackEvent& e) {
        if (!settings.quiet) {
            std::cerr << YELLOW << "\n[ROLLBACK] " << e.path.filename().string()
                      << " restored to its original bytes" << RESET << std::endl;
        }
    });
    bus.subscribe<WorkflowSucceededEvent>([&](const WorkflowSucceededEvent& e) {
        Result r;
        r.attempt = orchestrator.status().attempt;
        r.source = settings.url;
        r.path = e.path;
        r.mime = MimeDetector::detect(e.path);
        std::error_code ec;
        r.size = fs::file_size(e.path, ec);
        r.success = true;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
    });
    bus.subscribe<WorkflowFailedEvent>([&](const WorkflowFailedEvent& e) {
        Result r;
        r.attempt = orchestrator.status().attempt;
        r.source = settings.url;
        r.success = false;
        r.cleanup_ok = e.cleanup_ok;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        r.error_kind = std::string(to_string(e.error.kind));
        r.error_msg = e.error.message;
        results.push_back(std::move(r));
    });

    try {
        orchestrator.submit(WorkflowRequest{settings.url, fields_from(settings)});
    } catch (const FetchtagError& e) {
        print_error(e.error());
        return exit_code_for(e.error());
    }

    for (;;) {
        while (!orchestrator.wait_for(std::chrono::milliseconds(200))) {
            if (interrupted.load()) {
                std::cerr << CYAN << "\n[INTERRUPT] Stop detected. Cleaning up..." << RESET << std::endl;
                if (!orchestrator.cancel()) {
                    Logger::log(LogLevel::Warning, "Cleanup after interrupt reported errors", "main");
                }
            }
        }
        if (!settings.quiet) progress.finish();

        const auto error = orchestrator.last_error();
        if (!error) break;
        if (!settings.auto_retry || interrupted.load() || !error->retryable ||
            orchestrator.status().attempt >= settings.max_attempts) {
            break;
        }
        std::cerr << YELLOW << "Attempt " << orchestrator.status().attempt << " failed ("
                  << error->user_message() << "), retrying..." << RESET << std::endl;
        try {
            orchestrator.retry();
        } catch (const FetchtagError& e) {
            Logger::log(LogLevel::Warning, std::string("Retry refused: ") + e.what(), "main");
            break;
        }
    }

    if (const auto error = orchestrator.last_error()) {
        print_error(*error);
        return interrupted.load() ? kExitInterrupted : exit_code_for(*error);
    }
    if (!settings.quiet) {
        std::cerr << GREEN << "[DONE] " << orchestrator.result_path()->string() << RESET << std::endl;
    }
    return kExitOk;
}

int run_tag(const Settings& settings, std::vector<Result>& results) {
    TagEngineSettings engine_settings;
    engine_settings.extension = settings.extension;
    TagMutationEngine engine(engine_settings);

    const auto started = std::chrono::steady_clock::now();
    Result r;
    r.attempt = 1;
    r.source = settings.file.string();
    try {
        engine.apply_fields(settings.file, fields_from(settings));
        r.success = true;
        r.path = settings.file;
        r.mime = MimeDetector::detect(settings.file);
        std::error_code ec;
        r.size = fs::file_size(settings.file, ec);
    } catch (const FetchtagError& e) {
        r.error_kind = std::string(to_string(e.kind()));
        r.error_msg = e.error().message;
        print_error(e.error());
    }
    r.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    results.push_back(r);

    if (!r.success) {
        return r.error_kind == to_string(ErrorKind::RestoreFailed) ? kExitCritical : kExitFailure;
    }
    if (!settings.quiet) {
        const auto s = engine.summary(settings.file);
        std::cout << GREEN << "[DONE] " << settings.file.filename().string() << RESET
                  << ": " << s.artist << " - " << s.title << " (" << s.album << ", track " << s.track << ")"
                  << std::endl;
    }
    return kExitOk;
}

int run_inspect(const Settings& settings) {
    TagEngineSettings engine_settings;
    engine_settings.extension = settings.extension;
    const TagMutationEngine engine(engine_settings);

    const bool valid = engine.validate(settings.file);
    const auto mime = MimeDetector::detect(settings.file);
    const auto description = MimeDetector::describe(settings.file);

    std::cout << "File:        " << settings.file.string() << "\n"
              << "MIME type:   " << (mime.empty() ? "unknown" : mime) << "\n"
              << "Type:        " << (description.empty() ? "unknown" : description) << "\n"
              << "MPEG-1 L3:   " << (MimeDetector::is_mpeg1_layer3(settings.file) ? "yes" : "no") << "\n"
              << "Valid audio: " << (valid ? "yes" : "no") << std::endl;
    if (!valid) return kExitFailure;

    const auto s = engine.summary(settings.file);
    std::cout << "Size:        " << s.file_size << "\n"
              << "Duration:    " << s.duration << "\n\nTags:\n";
    for (const auto& [key, value] : engine.read_fields(settings.file)) {
        std::cout << "  " << key << " = " << value << "\n";
    }
    std::cout << std::flush;
    return kExitOk;
}

int run_watch(const Settings& settings) {
    CompletionDetector detector(detector_settings_from(settings));
    try {
        detector.start_watching(WatchTarget{settings.download_dir, settings.extension});
    } catch (const FetchtagError& e) {
        print_error(e.error());
        return exit_code_for(e.error());
    }
    if (!settings.quiet) {
        std::cerr << CYAN << "Waiting for a completed *" << settings.extension << " download in "
                  << settings.download_dir.string() << " (Ctrl+C to stop)" << RESET << std::endl;
    }

    // found and failure belong to the waiter until it has been joined
    std::optional<fs::path> found;
    std::optional<ClassifiedError> failure;
    std::atomic<bool> done{false};
    {
        std::jthread waiter([&](const std::stop_token& st) {
            try {
                found = detector.await_new_file_or_recent(std::chrono::seconds(settings.download_timeout),
                                                          std::chrono::minutes(settings.lookback), st);
            } catch (const FetchtagError& e) {
                failure = e.error();
            }
            done.store(true);
        });
        while (!interrupted.load() && !done.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        // jthread requests stop and joins here
    }

    if (!detector.stop_watching()) {
        Logger::log(LogLevel::Warning, "Detector did not release its watch cleanly", "main");
    }

    if (failure) {
        print_error(*failure);
        return exit_code_for(*failure);
    }
    if (found) {
        std::cout << found->string() << std::endl;
        return kExitOk;
    }
    if (interrupted.load()) return kExitInterrupted;
    std::cerr << YELLOW << "No completed download within " << settings.download_timeout << " seconds" << RESET << std::endl;
    return kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"fetchtag: download audio through a conversion service and tag it safely."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set file logger
    Logger::clear_sinks();
    auto fileSink = std::make_unique<FileLogSink>(settings.log_file, true);
    if (!fileSink->is_open()) {
        std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
    }
    Logger::add_sink(std::move(fileSink));

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    std::vector<Result> results;
    const auto start_total = std::chrono::steady_clock::now();

    int code = kExitFailure;
    try {
        switch (settings.command) {
            case Command::Fetch:   code = run_fetch(settings, results); break;
            case Command::Tag:     code = run_tag(settings, results); break;
            case Command::Inspect: code = run_inspect(settings); break;
            case Command::Watch:   code = run_watch(settings); break;
            case Command::None:    break;
        }
    } catch (const FetchtagError& e) {
        print_error(e.error());
        code = exit_code_for(e.error());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        std::cerr << RED << "Unexpected error: " << e.what() << RESET << std::endl;
        code = kExitFailure;
    }

    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
    if (!results.empty()) {
        if (!settings.quiet) {
            print_console_report(results, total_seconds);
        }
        // export CSV if requested
        if (!settings.report_path.empty()) {
            export_csv_report(results, settings.report_path, total_seconds);
        }
    }

    if (interrupted.load() && code != kExitCritical) {
        return kExitInterrupted; // standard exit code for SIGINT
    }
    return code;
}
