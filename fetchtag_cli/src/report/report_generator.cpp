//
// Created by Giuseppe Francione on 16/10/26.
//

#include "report_generator.hpp"
#include "../../../libfetchtag/include/file_utils.hpp"
#include "../../../libfetchtag/include/logger.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string outcome_of(const Result& r, const bool use_colors) {
    if (!r.success) {
        return use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
    }
    return use_colors ? "\033[1;32mOK\033[0m" : "OK";
}

void print_console_report(const std::vector<Result>& results,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stdout_a_tty();

    // calculate column widths
    size_t max_attempt = 9;
    size_t max_mime = 12;
    size_t max_size = 10;
    size_t max_time = 9;
    size_t max_result = 8;
    size_t max_kind = 6;
    for (const auto& r : results) {
        max_mime   = std::max(max_mime,   r.mime.size() + 2);
        max_size   = std::max(max_size,   fetchtag::human_size(r.size).size() + 2);
        max_time   = std::max(max_time,   std::format("{:.1f}", r.seconds).size() + 2);
        max_result = std::max(max_result, strip_ansi(outcome_of(r, use_colors)).size() + 2);
        max_kind   = std::max(max_kind,   r.error_kind.size() + 2);
    }

    const size_t fixed_cols_width = max_attempt + max_mime + max_size + max_time + max_result + max_kind;
    const size_t file_col_width = term_width > fixed_cols_width + 20
                                      ? std::min<size_t>(term_width - fixed_cols_width - 10, 48)
                                      : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    const auto fmt_str = std::string("{:<") + std::to_string(max_attempt) + "}"
                       + "{:<" + std::to_string(file_col_width) + "}"
                       + "{:<" + std::to_string(max_mime) + "}"
                       + "{:<" + std::to_string(max_size) + "}"
                       + "{:<" + std::to_string(max_time) + "}"
                       + "{:<" + std::to_string(max_result) + "}"
                       + "{:<" + std::to_string(max_kind) + "}"
                       + "{}\n";

    std::cout << "\n" << std::vformat(fmt_str,
        std::make_format_args("Attempt", "File", "MIME type", "Size", "Time(s)", "Result", "Kind", "Error"));

    size_t succeeded = 0;
    for (const auto& r : results) {
        const std::string file = r.path.empty() ? r.source : r.path.filename().string();
        const std::string attempt = std::to_string(r.attempt);
        const std::string truncated = truncate(file, file_col_width - 1);
        const std::string size = r.size ? fetchtag::human_size(r.size) : "-";
        const std::string seconds = std::format("{:.1f}", r.seconds);
        const std::string mime = r.mime.empty() ? "-" : r.mime;
        const std::string kind = r.error_kind.empty() ? "-" : r.error_kind;
        std::string error = r.error_msg;
        if (!r.cleanup_ok) error += error.empty() ? "cleanup incomplete" : " (cleanup incomplete)";

        // colour codes would break the padding, pad the plain text then wrap it
        std::string result = strip_ansi(outcome_of(r, false));
        result.resize(max_result, ' ');
        if (use_colors) result = (r.success ? "\033[1;32m" : "\033[1;31m") + result + "\033[0m";

        const auto plain_fmt = std::string("{:<") + std::to_string(max_attempt) + "}"
                             + "{:<" + std::to_string(file_col_width) + "}"
                             + "{:<" + std::to_string(max_mime) + "}"
                             + "{:<" + std::to_string(max_size) + "}"
                             + "{:<" + std::to_string(max_time) + "}"
                             + "{}"
                             + "{:<" + std::to_string(max_kind) + "}"
                             + "{}\n";
        std::cout << std::vformat(plain_fmt,
            std::make_format_args(attempt, truncated, mime, size, seconds, result, kind, error));
        if (r.success) ++succeeded;
    }

    std::cout << "\n" << succeeded << "/" << results.size() << " attempt(s) succeeded in "
              << std::fixed << std::setprecision(1) << total_seconds << "s" << std::endl;
}

void export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report to " + output_path.string(), "report");
        return;
    }

    out << "Attempt,Source,File,MIME,Size(bytes),Time(s),Result,Kind,Error,CleanupOK\n";

    for (const auto& r : results) {
        std::ostringstream osstime;
        osstime << std::fixed << std::setprecision(2) << r.seconds;

        out << r.attempt << ","
            << csv_escape(r.source) << ","
            << csv_escape(r.path.empty() ? "" : r.path.string()) << ","
            << csv_escape(r.mime) << ","
            << r.size << ","
            << osstime.str() << ","
            << (r.success ? "OK" : "FAIL") << ","
            << csv_escape(r.error_kind) << ","
            << csv_escape(r.error_msg) << ","
            << (r.cleanup_ok ? "yes" : "no") << "\n";
    }

    std::ostringstream osstotal;
    osstotal << std::fixed << std::setprecision(2) << total_seconds;
    out << "\nTotal time (s)," << osstotal.str() << "\n";
    Logger::log(LogLevel::Info, "Report written to " + output_path.string(), "report");
}
