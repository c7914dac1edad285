//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file header_signature.hpp
 * @brief Leading-byte checks for MPEG audio payloads.
 *
 * Both the completion detector (is the download finished?) and the tag engine
 * (is this still an MP3 after we rewrote it?) accept a file only when it
 * starts with an ID3v2 container tag or an MPEG audio frame sync.
 */

#ifndef FETCHTAG_HEADER_SIGNATURE_HPP
#define FETCHTAG_HEADER_SIGNATURE_HPP

#include <cstddef>
#include <filesystem>
#include <span>
#include <system_error>

namespace fetchtag {

/// Bytes read from the start of a file for the signature check.
inline constexpr std::size_t kHeaderProbeSize = 10;

enum class HeaderSignature {
    None,
    Id3v2Tag,   ///< "ID3"
    FrameSync   ///< 0xFF then 0b111xxxxx
};

/// @brief Classify an in-memory header.
[[nodiscard]] HeaderSignature classify_header(std::span<const unsigned char> bytes) noexcept;

/**
 * @brief Read the first bytes of @p path and classify them.
 * @param ec Set when the file cannot be opened or read; the result is then None.
 */
[[nodiscard]] HeaderSignature read_header_signature(const std::filesystem::path& path,
                                                    std::error_code& ec);

[[nodiscard]] inline bool is_known_signature(const HeaderSignature s) noexcept {
    return s != HeaderSignature::None;
}

} // namespace fetchtag

#endif // FETCHTAG_HEADER_SIGNATURE_HPP
