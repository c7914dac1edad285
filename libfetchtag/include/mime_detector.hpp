//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_MIME_DETECTOR_HPP
#define FETCHTAG_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace fetchtag {

    /**
     * @brief Content-based file type detection through libmagic.
     *
     * Used by `fetchtag inspect` to show what a download really is, which
     * matters when the conversion service hands back an HTML error page
     * named ".mp3".
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A string such as "audio/mpeg"; empty if libmagic is unavailable.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief libmagic's textual description ("Audio file with ID3 version 2.4.0, ...").
         * @return Empty if libmagic is unavailable.
         */
        static std::string describe(const std::filesystem::path& path);

        /**
         * @brief Specifically checks if a file is MPEG-1 Layer 3 (MP3).
         * @param path The filesystem path to the file.
         * @return true if the file is identified as MP3, false otherwise.
         */
        static bool is_mpeg1_layer3(const std::filesystem::path& path);
    };

} // namespace fetchtag
#endif //FETCHTAG_MIME_DETECTOR_HPP
