//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/header_signature.hpp"
#include "../../include/file_utils.hpp"
#include <array>
#include <cerrno>
#include <memory>

namespace fetchtag {

HeaderSignature classify_header(const std::span<const unsigned char> bytes) noexcept {
    if (bytes.size() >= 3 && bytes[0] == 'I' && bytes[1] == 'D' && bytes[2] == '3') {
        return HeaderSignature::Id3v2Tag;
    }
    if (bytes.size() >= 2 && bytes[0] == 0xFF && (bytes[1] & 0xE0) == 0xE0) {
        return HeaderSignature::FrameSync;
    }
    return HeaderSignature::None;
}

HeaderSignature read_header_signature(const std::filesystem::path& path, std::error_code& ec) {
    ec.clear();
    const unique_FILE fp(open_file(path, "rb"));
    if (!fp) {
        ec.assign(errno != 0 ? errno : EIO, std::generic_category());
        return HeaderSignature::None;
    }

    std::array<unsigned char, kHeaderProbeSize> header{};
    const std::size_t got = std::fread(header.data(), 1, header.size(), fp.get());
    if (got < header.size() && std::ferror(fp.get())) {
        ec.assign(EIO, std::generic_category());
        return HeaderSignature::None;
    }
    return classify_header(std::span<const unsigned char>(header.data(), got));
}

} // namespace fetchtag
