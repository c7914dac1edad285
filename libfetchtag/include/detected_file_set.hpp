//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_DETECTED_FILE_SET_HPP
#define FETCHTAG_DETECTED_FILE_SET_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace fetchtag {

/**
 * @brief A matching file the detector has seen during the current session.
 */
struct DetectedFile {
    std::filesystem::path path;                      ///< absolute
    std::chrono::system_clock::time_point first_seen;
    bool stabilized = false;
};

/**
 * @brief Detector bookkeeping, keyed by path.
 *
 * Written from the inotify observer thread and read from the polling loop,
 * so every member function takes the same mutex. Insertion is idempotent:
 * a path is never recorded twice.
 */
class DetectedFileSet {
public:
    /**
     * @brief Record @p path if it is new.
     * @return true if it was inserted, false if it was already known.
     */
    bool insert(const std::filesystem::path& path);

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

    /// @return Entry for @p path, if recorded.
    [[nodiscard]] std::optional<DetectedFile> find(const std::filesystem::path& path) const;

    /// @return Paths not yet stabilized, oldest first.
    [[nodiscard]] std::vector<std::filesystem::path> pending() const;

    /// @return Paths already stabilized.
    [[nodiscard]] std::vector<std::filesystem::path> stabilized() const;

    /**
     * @brief Flag @p path as stabilized.
     * @return false if the path is unknown.
     */
    bool mark_stabilized(const std::filesystem::path& path);

    /// @brief Forget @p path (it vanished or failed for good).
    void erase(const std::filesystem::path& path);

    void clear();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::filesystem::path, DetectedFile> files_;
};

} // namespace fetchtag

#endif // FETCHTAG_DETECTED_FILE_SET_HPP
