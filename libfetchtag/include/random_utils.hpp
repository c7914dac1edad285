//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_RANDOM_UTILS_H
#define FETCHTAG_RANDOM_UTILS_H

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers used to keep probe and backup file
 * names unique when two attempts land in the same second.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Short hexadecimal suffix for file names (16 hex digits).
     */
    std::string random_suffix();

} // namespace

#endif //FETCHTAG_RANDOM_UTILS_H
