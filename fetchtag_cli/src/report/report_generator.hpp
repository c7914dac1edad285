//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_REPORT_GENERATOR_HPP
#define FETCHTAG_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Result {
    int attempt{};                 // 1-based workflow attempt
    std::string source;            // url for fetch, file for tag
    std::filesystem::path path;    // tagged file, empty if none was produced
    std::string mime;              // detected mime of the produced file
    uintmax_t size{};              // produced file size in bytes
    bool success{};
    bool cleanup_ok{true};         // trigger closed and watch released
    double seconds{};
    std::string error_kind;        // if !success, the classified kind
    std::string error_msg;         // if !success, reason of failure
};

void print_console_report(const std::vector<Result>& results,
                          double total_seconds);

void export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif // FETCHTAG_REPORT_GENERATOR_HPP
