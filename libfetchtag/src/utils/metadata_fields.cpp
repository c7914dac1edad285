//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/metadata_fields.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace fetchtag {

namespace {

bool is_blank(const std::string& s) {
    return std::ranges::all_of(s, [](const unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(const std::string& s) {
    const auto first = std::ranges::find_if_not(s, [](const unsigned char c) { return std::isspace(c) != 0; });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](const unsigned char c) { return std::isspace(c) != 0; }).base();
    return first < last ? std::string(first, last) : std::string();
}

} // namespace

std::vector<std::string> MetadataFields::validate() const {
    std::vector<std::string> errors;
    if (is_blank(artist)) errors.emplace_back("Artist field cannot be empty.");
    if (is_blank(title))  errors.emplace_back("Title field cannot be empty.");
    if (is_blank(album))  errors.emplace_back("Album field cannot be empty.");
    if (track_number <= 0) errors.emplace_back("Track number must be a positive integer.");
    return errors;
}

std::vector<std::string> WorkflowRequest::validate() const {
    std::vector<std::string> errors;
    if (!is_supported_source_url(source_url)) {
        errors.emplace_back("Invalid video URL format. Please enter a valid YouTube URL.");
    }
    auto field_errors = fields.validate();
    errors.insert(errors.end(),
                  std::make_move_iterator(field_errors.begin()),
                  std::make_move_iterator(field_errors.end()));
    return errors;
}

bool is_supported_source_url(const std::string& url) {
    static const std::array<std::regex, 4> patterns = {
        std::regex(R"(^https?://(www\.)?youtube\.com/watch\?v=[\w-]+)"),
        std::regex(R"(^https?://(www\.)?youtu\.be/[\w-]+)"),
        std::regex(R"(^https?://(www\.)?youtube\.com/embed/[\w-]+)"),
        std::regex(R"(^https?://(www\.)?youtube\.com/v/[\w-]+)")
    };
    const std::string candidate = trim(url);
    if (candidate.empty()) return false;
    return std::ranges::any_of(patterns, [&](const std::regex& re) {
        return std::regex_search(candidate, re);
    });
}

std::string join_messages(const std::vector<std::string>& messages) {
    std::string out;
    for (const auto& m : messages) {
        if (!out.empty()) out += ", ";
        out += m;
    }
    return out;
}

} // namespace fetchtag
