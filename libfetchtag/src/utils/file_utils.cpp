//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iomanip>
#include <sstream>
#include <thread>
#include <sys/stat.h>

namespace fetchtag {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        errno = 0;
        return std::fopen(path.c_str(), mode);
    }

    std::string lower_extension(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    bool has_extension(const std::filesystem::path& path, const std::string_view extension) {
        if (extension.empty()) return true;
        std::string wanted(extension);
        if (wanted.front() != '.') wanted.insert(wanted.begin(), '.');
        std::ranges::transform(wanted, wanted.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower_extension(path) == wanted;
    }

    bool probe_directory_access(const std::filesystem::path& dir, std::error_code& ec) {
        ec.clear();
        if (!std::filesystem::is_directory(dir, ec)) {
            if (!ec) ec = std::make_error_code(std::errc::not_a_directory);
            return false;
        }

        const auto marker = dir / (".fetchtag_probe_" + RandomUtils::random_suffix());
        {
            const unique_FILE fp(open_file(marker, "wb"));
            if (!fp) {
                ec.assign(errno != 0 ? errno : EACCES, std::generic_category());
                return false;
            }
            if (std::fputs("probe", fp.get()) < 0) {
                ec.assign(errno != 0 ? errno : EIO, std::generic_category());
                std::error_code ignored;
                std::filesystem::remove(marker, ignored);
                return false;
            }
        }

        std::filesystem::remove(marker, ec);
        if (ec) {
            Logger::log(LogLevel::Warning,
                        "Write probe could not be removed: " + marker.string() + " (" + ec.message() + ")",
                        "file_utils");
            return false;
        }

        // readable too: listing must work for the fallback scan
        std::filesystem::directory_iterator it(dir, ec);
        return !ec;
    }

    std::optional<std::uintmax_t> available_space(const std::filesystem::path& path) {
        std::error_code ec;
        const auto info = std::filesystem::space(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning,
                        "Cannot query free space for " + path.string() + " (" + ec.message() + ")",
                        "file_utils");
            return std::nullopt;
        }
        return info.available;
    }

    std::optional<std::chrono::system_clock::time_point> change_time(const std::filesystem::path& path) {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            return std::nullopt;
        }
        const auto since_epoch = std::chrono::seconds(st.st_ctim.tv_sec) +
                                 std::chrono::nanoseconds(st.st_ctim.tv_nsec);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    }

    std::filesystem::path make_backup_path(const std::filesystem::path& target, const std::string_view suffix) {
        const auto now = std::chrono::system_clock::now();
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        std::filesystem::path candidate = target;
        candidate += std::string(suffix) + "." + std::to_string(secs);

        std::error_code ec;
        while (std::filesystem::exists(candidate, ec)) {
            candidate = target;
            candidate += std::string(suffix) + "." + std::to_string(secs) + "_" + RandomUtils::random_suffix();
        }
        return candidate;
    }

    void rename_with_retries(const std::filesystem::path& from,
                             const std::filesystem::path& to,
                             std::error_code& ec,
                             int attempts,
                             const std::string_view tag) {
        while (attempts > 0) {
            std::filesystem::rename(from, to, ec);
            if (!ec) return;

            // only busy/permission errors are worth waiting for
            if (ec != std::errc::device_or_resource_busy &&
                ec != std::errc::permission_denied &&
                ec != std::errc::text_file_busy) {
                return;
            }

            Logger::log(LogLevel::Debug,
                        "Rename " + from.filename().string() + " failed (" + ec.message() + "), retrying in 250ms...",
                        tag);
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            --attempts;
        }
    }

    bool remove_file_logged(const std::filesystem::path& path, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove file: " + path.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed file: " + path.string(), tag);
        return true;
    }

    std::string human_size(const std::uintmax_t bytes) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
        return oss.str();
    }

} // namespace fetchtag
