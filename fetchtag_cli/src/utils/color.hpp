//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_COLOR_HPP
#define FETCHTAG_COLOR_HPP

// ansi escapes used for console output
inline constexpr auto RESET  = "\033[0m";
inline constexpr auto RED    = "\033[1;31m";
inline constexpr auto GREEN  = "\033[1;32m";
inline constexpr auto YELLOW = "\033[1;33m";
inline constexpr auto CYAN   = "\033[1;36m";

#endif // FETCHTAG_COLOR_HPP
