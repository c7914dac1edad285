//
// Created by Giuseppe Francione on 16/10/26.
//

#include "console_progress_sink.hpp"
#include "../report/report_generator.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

ConsoleProgressSink::ConsoleProgressSink()
    : started_(std::chrono::steady_clock::now()) {
}

void ConsoleProgressSink::report(const std::string& message, const int percent) {
    std::lock_guard lock(mtx_);
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 60u ? term_width - 60u : 20u);
    const unsigned pos = bar_width * static_cast<unsigned>(std::clamp(percent, 0, 100)) / 100u;
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

    std::string label = message;
    if (label.size() > 32) label = label.substr(0, 29) + "...";

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && percent < 100) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] " << std::setw(3) << percent << "% "
              << std::left << std::setw(32) << label << std::right
              << " " << std::fixed << std::setprecision(1) << elapsed << "s"
              << std::flush;
    drawn_ = true;
}

void ConsoleProgressSink::finish() {
    std::lock_guard lock(mtx_);
    if (drawn_) std::cerr << std::endl;
    drawn_ = false;
}
