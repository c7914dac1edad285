//
// Created by Giuseppe Francione on 16/10/26.
//

/**
 * @file tag_mutation_engine.hpp
 * @brief Rewrites the artist/title/album/track tags of an MP3 in place, safely.
 *
 * Every mutation runs behind a verified byte-for-byte backup. If writing or
 * re-validation fails the backup is moved back over the target; if even that
 * fails the backup is left on disk and a RestoreFailed error is raised.
 */

#ifndef FETCHTAG_TAG_MUTATION_ENGINE_HPP
#define FETCHTAG_TAG_MUTATION_ENGINE_HPP

#include "classified_error.hpp"
#include "metadata_fields.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace fetchtag {

class EventBus;

/// Every tag entry of a file, keyed by TagLib property name (ARTIST, COMMENT, ...).
using TagMap = std::map<std::string, std::string>;

enum class MutationPhase {
    Unstarted,
    Validated,
    BackedUp,
    Written,
    Verified,
    RolledBack,
    RestoreFailed
};

const char* to_string(MutationPhase phase) noexcept;

/**
 * @brief Book-keeping for one apply_fields() call.
 */
struct MutationAttempt {
    std::filesystem::path target;
    std::optional<std::filesystem::path> backup;
    std::uintmax_t original_size = 0;
    MutationPhase phase = MutationPhase::Unstarted;

    /**
     * @brief Advance the phase machine.
     * @throws std::logic_error if @p next is not reachable from the current phase.
     */
    void transition(MutationPhase next);

    [[nodiscard]] static bool is_allowed(MutationPhase from, MutationPhase to) noexcept;
    [[nodiscard]] bool succeeded() const noexcept { return phase == MutationPhase::Verified; }
};

/**
 * @brief Human readable metadata overview, as shown by `fetchtag inspect`.
 * Fields that cannot be determined are left empty.
 */
struct TagSummary {
    std::string artist;
    std::string title;
    std::string album;
    std::string track;
    std::string file_size;  ///< "3.4 MB"
    std::string duration;   ///< "3:25"
};

struct TagEngineSettings {
    std::string extension = ".mp3";
    std::uintmax_t min_file_size = 1024;
    std::uintmax_t space_factor = 2;   ///< free space required, as a multiple of the file size
    int restore_attempts = 10;
};

class TagMutationEngine {
public:
    explicit TagMutationEngine(TagEngineSettings settings = {}, EventBus* bus = nullptr);
    virtual ~TagMutationEngine() = default;

    TagMutationEngine(const TagMutationEngine&) = delete;
    TagMutationEngine& operator=(const TagMutationEngine&) = delete;

    /**
     * @brief true only for an existing, plausibly sized MP3 that TagLib can
     * parse, that has a positive duration and an ID3/frame-sync header.
     */
    [[nodiscard]] bool validate(const std::filesystem::path& path) const;

    /**
     * @brief All tag entries of @p path; multi-valued entries joined with ", ".
     * @throws FetchtagError (TagValidationFailed) if validate() rejects the file.
     */
    [[nodiscard]] TagMap read_fields(const std::filesystem::path& path) const;

    /**
     * @brief Overwrite ARTIST, TITLE, ALBUM and TRACKNUMBER, keeping every other entry.
     *
     * Not safe against a concurrent mutation of the same path.
     *
     * @return The finished attempt (phase Verified, backup removed).
     * @throws FetchtagError TagValidationFailed, InputValidation, BackupFailed,
     * MutationFailed (original restored) or RestoreFailed (backup left in place).
     */
    MutationAttempt apply_fields(const std::filesystem::path& path, const MetadataFields& fields);

    /**
     * @brief Copy @p path to a timestamped sibling and verify its size.
     * @throws FetchtagError (BackupFailed).
     */
    std::filesystem::path backup_original(const std::filesystem::path& path);

    [[nodiscard]] TagSummary summary(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] const TagEngineSettings& settings() const noexcept { return settings_; }

protected:
    /// Write the four fields and save. Throws on any failure.
    virtual void write_tags(const std::filesystem::path& path, const MetadataFields& fields);

    virtual std::optional<std::uintmax_t> available_space_for(const std::filesystem::path& directory) const;

private:
    void ensure_space_for_backup(const std::filesystem::path& path, std::uintmax_t size) const;
    std::filesystem::path create_verified_backup(const std::filesystem::path& path, std::uintmax_t size) const;
    [[noreturn]] void roll_back(MutationAttempt& attempt, const ClassifiedError& cause);

    TagEngineSettings settings_;
    EventBus* bus_;
};

} // namespace fetchtag

#endif // FETCHTAG_TAG_MUTATION_ENGINE_HPP
