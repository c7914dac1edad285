//
// Created by Giuseppe Francione on 16/10/26.
//

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <string>

namespace {

    // raii wrapper for magic cookies
    struct MagicCloser {
        void operator()(const magic_t m) const { if (m) magic_close(m); }
    };
    using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

    unique_magic open_magic(const int flags)
    {
        unique_magic magic(magic_open(flags | MAGIC_ERROR));
        if (!magic) {
            Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
            return nullptr;
        }
        // honours $MAGIC, otherwise the system database
        if (magic_load(magic.get(), nullptr) != 0) {
            const char* err = magic_error(magic.get());
            Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
            return nullptr;
        }
        return magic;
    }

    std::string query(const std::filesystem::path& path, const int flags)
    {
        const auto magic = open_magic(flags);
        if (!magic) return {};
        const char* result = magic_file(magic.get(), path.c_str());
        if (!result) {
            const char* err = magic_error(magic.get());
            Logger::log(LogLevel::Debug, "magic_file failed for " + path.string() + ": " + (err ? err : "unknown error"), "libmagic");
            return {};
        }
        return result;
    }

} // namespace

std::string fetchtag::MimeDetector::detect(const std::filesystem::path& path)
{
    return query(path, MAGIC_MIME_TYPE);
}

std::string fetchtag::MimeDetector::describe(const std::filesystem::path& path)
{
    return query(path, MAGIC_NONE);
}

bool fetchtag::MimeDetector::is_mpeg1_layer3(const std::filesystem::path& path)
{
    const std::string s = describe(path);
    return s.find("MPEG") != std::string::npos &&
           s.find("layer III") != std::string::npos &&
           (s.find("v1") != std::string::npos || s.find("version 1") != std::string::npos);
}
