//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_FILE_UTILS_HPP
#define FETCHTAG_FILE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace fetchtag {

    // raii wrapper for file pointers
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed (errno is set).
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Lower-cased extension including the dot ("Song.MP3" -> ".mp3").
     */
    std::string lower_extension(const std::filesystem::path &path);

    /**
     * @brief Case-insensitive extension match; @p extension may omit the dot.
     */
    bool has_extension(const std::filesystem::path &path, std::string_view extension);

    /**
     * @brief Confirm a directory is usable by creating, writing and deleting a marker file.
     *
     * A stat() tells nothing about write permission on network shares and
     * sandboxed download folders; actually writing does.
     *
     * @param dir Directory to probe.
     * @param ec Receives the first failure.
     * @return true when the directory exists, is a directory, and the probe round-trip worked.
     */
    bool probe_directory_access(const std::filesystem::path &dir, std::error_code &ec);

    /**
     * @brief Bytes available to an unprivileged user on the volume holding @p path.
     * @return nullopt if the volume cannot be queried.
     */
    std::optional<std::uintmax_t> available_space(const std::filesystem::path &path);

    /**
     * @brief Inode change time of @p path as a system_clock time point.
     *
     * Linux does not expose a portable creation time; the change time is
     * what a freshly downloaded or renamed file updates.
     */
    std::optional<std::chrono::system_clock::time_point> change_time(const std::filesystem::path &path);

    /**
     * @brief Backup path beside @p target: "<name>.backup.<unix-seconds>".
     *
     * If that name is taken (two attempts within the same second) a random
     * suffix is appended until the name is free.
     */
    std::filesystem::path make_backup_path(const std::filesystem::path &target,
                                           std::string_view suffix = ".backup");

    /**
     * @brief Rename with a short retry loop for transient sharing/lock errors.
     * @param attempts Number of tries before giving up.
     * @param tag Logger tag.
     */
    void rename_with_retries(const std::filesystem::path &from,
                             const std::filesystem::path &to,
                             std::error_code &ec,
                             int attempts = 10,
                             std::string_view tag = "file_utils");

    /**
     * @brief Remove a file and log (but do not propagate) failures.
     * @return true if the file is gone afterwards.
     */
    bool remove_file_logged(const std::filesystem::path &path,
                            std::string_view tag = "file_utils");

    /**
     * @brief "3.4 MB" style size.
     */
    std::string human_size(std::uintmax_t bytes);
} // namespace fetchtag

#endif // FETCHTAG_FILE_UTILS_HPP
