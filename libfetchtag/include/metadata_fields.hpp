//
// Created by Giuseppe Francione on 16/10/26.
//

#ifndef FETCHTAG_METADATA_FIELDS_HPP
#define FETCHTAG_METADATA_FIELDS_HPP

#include <string>
#include <vector>

namespace fetchtag {

/**
 * @brief The four user-facing tag values written by TagMutationEngine.
 *
 * Plain value type; callers build it once and hand it over by const reference.
 */
struct MetadataFields {
    std::string artist;
    std::string title;
    std::string album;
    long track_number = 0;

    /**
     * @brief Check every field against its domain rule.
     * @return One message per offending field; empty when valid.
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    [[nodiscard]] bool is_valid() const { return validate().empty(); }
};

/**
 * @brief One download-and-tag job as submitted to WorkflowOrchestrator.
 */
struct WorkflowRequest {
    std::string source_url;
    MetadataFields fields;

    /// @return Messages for the URL and every invalid field; empty when valid.
    [[nodiscard]] std::vector<std::string> validate() const;
};

/**
 * @brief Recognise the video URL shapes the conversion service accepts
 * (watch?v=, youtu.be/, embed/, v/), http or https, optional "www.".
 */
[[nodiscard]] bool is_supported_source_url(const std::string& url);

/// @brief Join validation messages the way they are shown to the user.
[[nodiscard]] std::string join_messages(const std::vector<std::string>& messages);

} // namespace fetchtag

#endif // FETCHTAG_METADATA_FIELDS_HPP
