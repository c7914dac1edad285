//
// Created by Giuseppe Francione on 16/10/26.
//

#include "../../include/tag_mutation_engine.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/header_signature.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <taglib/mpegfile.h>
#include <taglib/mpegproperties.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstringlist.h>

namespace fs = std::filesystem;

namespace fetchtag {

namespace {

constexpr auto kTag = "tag_engine";

// the four entries apply_fields() owns; everything else is carried over
constexpr auto kArtistKey = "ARTIST";
constexpr auto kTitleKey = "TITLE";
constexpr auto kAlbumKey = "ALBUM";
constexpr auto kTrackKey = "TRACKNUMBER";

std::string trimmed(const std::string& s) {
    const auto first = std::ranges::find_if_not(s, [](const unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](const unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

TagLib::StringList utf8_list(const std::string& value) {
    return TagLib::StringList(TagLib::String(value, TagLib::String::UTF8));
}

std::string property_value(const TagLib::PropertyMap& props, const char* key) {
    const auto it = props.find(key);
    if (it == props.end() || it->second.isEmpty()) return {};
    return it->second.toString(", ").to8Bit(true);
}

fs::path containing_directory(const fs::path& path) {
    auto dir = path.parent_path();
    return dir.empty() ? fs::path(".") : dir;
}

std::string format_duration(const int seconds) {
    const int minutes = seconds / 60;
    const int rest = seconds % 60;
    return std::to_string(minutes) + ":" + (rest < 10 ? "0" : "") + std::to_string(rest);
}

} // namespace

const char* to_string(const MutationPhase phase) noexcept {
    switch (phase) {
        case MutationPhase::Unstarted:     return "Unstarted";
        case MutationPhase::Validated:     return "Validated";
        case MutationPhase::BackedUp:      return "BackedUp";
        case MutationPhase::Written:       return "Written";
        case MutationPhase::Verified:      return "Verified";
        case MutationPhase::RolledBack:    return "RolledBack";
        case MutationPhase::RestoreFailed: return "RestoreFailed";
    }
    return "Unknown";
}

bool MutationAttempt::is_allowed(const MutationPhase from, const MutationPhase to) noexcept {
    switch (from) {
        case MutationPhase::Unstarted:
            return to == MutationPhase::Validated;
        case MutationPhase::Validated:
            return to == MutationPhase::BackedUp;
        case MutationPhase::BackedUp:
        case MutationPhase::Written:
            if (to == MutationPhase::RolledBack || to == MutationPhase::RestoreFailed) return true;
            return from == MutationPhase::BackedUp ? to == MutationPhase::Written
                                                   : to == MutationPhase::Verified;
        case MutationPhase::Verified:
        case MutationPhase::RolledBack:
        case MutationPhase::RestoreFailed:
            return false;
    }
    return false;
}

void MutationAttempt::transition(const MutationPhase next) {
    if (!is_allowed(phase, next)) {
        throw std::logic_error(std::string("illegal mutation phase transition ") +
                               to_string(phase) + " -> " + to_string(next));
    }
    phase = next;
}

TagMutationEngine::TagMutationEngine(TagEngineSettings settings, EventBus* bus)
    : settings_(std::move(settings)),
      bus_(bus) {
}

bool TagMutationEngine::validate(const fs::path& path) const {
    const auto name = path.filename().string();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        Logger::log(LogLevel::Debug, "Not a regular file: " + path.string(), kTag);
        return false;
    }
    if (!has_extension(path, settings_.extension)) {
        Logger::log(LogLevel::Debug, "Unexpected extension: " + name, kTag);
        return false;
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size < settings_.min_file_size) {
        Logger::log(LogLevel::Debug, "File too small to be audio: " + name, kTag);
        return false;
    }
    if (!is_known_signature(read_header_signature(path, ec)) || ec) {
        Logger::log(LogLevel::Debug, "No ID3/MPEG header: " + name, kTag);
        return false;
    }

    const TagLib::MPEG::File file(path.c_str());
    if (!file.isValid()) {
        Logger::log(LogLevel::Debug, "TagLib cannot parse " + name, kTag);
        return false;
    }
    const auto* props = file.audioProperties();
    if (!props || props->lengthInMilliseconds() <= 0) {
        Logger::log(LogLevel::Debug, "No audio duration in " + name, kTag);
        return false;
    }
    return true;
}

TagMap TagMutationEngine::read_fields(const fs::path& path) const {
    if (!validate(path)) {
        throw FetchtagError(ErrorKind::TagValidationFailed, Stage::Mutating,
                            "not a valid MP3 file: " + path.filename().string());
    }

    TagLib::MPEG::File file(path.c_str());
    const TagLib::PropertyMap props = file.properties();

    TagMap out;
    for (auto it = props.begin(); it != props.end(); ++it) {
        out[it->first.to8Bit(true)] = it->second.toString(", ").to8Bit(true);
    }
    return out;
}

MutationAttempt TagMutationEngine::apply_fields(const fs::path& path, const MetadataFields& fields) {
    MutationAttempt attempt;
    attempt.target = path;
    const auto name = path.filename().string();

    if (!validate(path)) {
        throw FetchtagError(ErrorKind::TagValidationFailed, Stage::Mutating,
                            "not a valid MP3 file: " + name);
    }
    if (const auto problems = fields.validate(); !problems.empty()) {
        throw FetchtagError(ErrorKind::InputValidation, Stage::Validation, join_messages(problems));
    }
    attempt.transition(MutationPhase::Validated);

    std::error_code ec;
    attempt.original_size = fs::file_size(path, ec);
    if (ec) {
        throw FetchtagError(ErrorKind::FileSystemAccess, Stage::Mutating,
                            "cannot read size of " + name + ": " + ec.message());
    }
    ensure_space_for_backup(path, attempt.original_size);
    attempt.backup = create_verified_backup(path, attempt.original_size);
    attempt.transition(MutationPhase::BackedUp);

    try {
        const auto existing = read_fields(path);
        const auto kept = std::ranges::count_if(existing, [](const auto& entry) {
            return entry.first != kArtistKey && entry.first != kTitleKey &&
                   entry.first != kAlbumKey && entry.first != kTrackKey;
        });
        Logger::log(LogLevel::Debug, "Preserving " + std::to_string(kept) + " other tag entries in " + name, kTag);

        write_tags(path, fields);
    } catch (const FetchtagError& e) {
        ClassifiedError cause = e.error();
        if (cause.kind == ErrorKind::TagValidationFailed) {
            cause = ClassifiedError::make(ErrorKind::MutationFailed, Stage::Mutating, cause.message);
        }
        roll_back(attempt, cause);
    } catch (const std::exception& e) {
        roll_back(attempt, ClassifiedError::make(ErrorKind::MutationFailed, Stage::Mutating,
                                                 std::string("writing tags failed: ") + e.what()));
    }
    attempt.transition(MutationPhase::Written);

    if (!validate(path)) {
        roll_back(attempt, ClassifiedError::make(ErrorKind::MutationFailed, Stage::Mutating,
                                                 name + " no longer validates after writing tags"));
    }
    attempt.transition(MutationPhase::Verified);

    remove_file_logged(*attempt.backup, kTag);
    attempt.backup.reset();
    Logger::log(LogLevel::Info, "Tagged " + name + ": " + trimmed(fields.artist) + " - " + trimmed(fields.title) +
                " (" + trimmed(fields.album) + ", track " + std::to_string(fields.track_number) + ")", kTag);
    return attempt;
}

void TagMutationEngine::write_tags(const fs::path& path, const MetadataFields& fields) {
    TagLib::MPEG::File file(path.c_str());
    if (!file.isValid()) {
        throw FetchtagError(ErrorKind::MutationFailed, Stage::Mutating,
                            "TagLib cannot reopen " + path.filename().string());
    }

    TagLib::PropertyMap props = file.properties();
    props.replace(kArtistKey, utf8_list(trimmed(fields.artist)));
    props.replace(kTitleKey, utf8_list(trimmed(fields.title)));
    props.replace(kAlbumKey, utf8_list(trimmed(fields.album)));
    props.replace(kTrackKey, utf8_list(std::to_string(fields.track_number)));

    const TagLib::PropertyMap rejected = file.setProperties(props);
    for (auto it = rejected.begin(); it != rejected.end(); ++it) {
        Logger::log(LogLevel::Warning, "Tag entry not representable in ID3v2, dropped by TagLib: " +
                    it->first.to8Bit(true), kTag);
    }

    if (!file.save()) {
        throw FetchtagError(ErrorKind::MutationFailed, Stage::Mutating,
                            "TagLib failed to save " + path.filename().string());
    }
}

std::optional<std::uintmax_t> TagMutationEngine::available_space_for(const fs::path& directory) const {
    return available_space(directory);
}

void TagMutationEngine::ensure_space_for_backup(const fs::path& path, const std::uintmax_t size) const {
    const auto available = available_space_for(containing_directory(path));
    if (!available) {
        throw FetchtagError(ErrorKind::BackupFailed, Stage::Mutating,
                            "cannot determine free disk space next to " + path.filename().string());
    }
    const auto needed = size * settings_.space_factor;
    if (*available < needed) {
        throw FetchtagError(ErrorKind::BackupFailed, Stage::Mutating,
                            "insufficient disk space to create backup: need " + std::to_string(needed) +
                            " bytes, have " + std::to_string(*available));
    }
}

fs::path TagMutationEngine::create_verified_backup(const fs::path& path, const std::uintmax_t size) const {
    const fs::path backup = make_backup_path(path);

    std::error_code ec;
    fs::copy_file(path, backup, fs::copy_options::none, ec);
    if (ec) {
        throw FetchtagError(ErrorKind::BackupFailed, Stage::Mutating,
                            "failed to create backup of " + path.filename().string() + ": " + ec.message());
    }

    const auto copied = fs::file_size(backup, ec);
    if (ec || copied != size) {
        remove_file_logged(backup, kTag);
        throw FetchtagError(ErrorKind::BackupFailed, Stage::Mutating,
                            "backup verification failed for " + path.filename().string() +
                            " (expected " + std::to_string(size) + " bytes)");
    }

    Logger::log(LogLevel::Debug, "Backup created: " + backup.filename().string(), kTag);
    return backup;
}

fs::path TagMutationEngine::backup_original(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FetchtagError(ErrorKind::BackupFailed, Stage::Mutating,
                            "cannot back up missing file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw FetchtagError(ErrorKind::BackupFailed, Stage::Mutating,
                            "cannot read size of " + path.filename().string() + ": " + ec.message());
    }
    ensure_space_for_backup(path, size);
    return create_verified_backup(path, size);
}

void TagMutationEngine::roll_back(MutationAttempt& attempt, const ClassifiedError& cause) {
    const auto name = attempt.target.filename().string();
    Logger::log(LogLevel::Warning, "Mutation of " + name + " failed (" + cause.message + "), restoring original", kTag);

    std::error_code ec;
    rename_with_retries(*attempt.backup, attempt.target, ec, settings_.restore_attempts, kTag);
    if (ec) {
        // rename can fail across mount points; a copy still restores the bytes
        std::error_code copy_ec;
        fs::copy_file(*attempt.backup, attempt.target, fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            attempt.transition(MutationPhase::RestoreFailed);
            const std::string message = "could not restore " + attempt.target.string() + " from backup " +
                                        attempt.backup->string() + " (" + copy_ec.message() +
                                        "); original error: " + cause.message;
            Logger::log(LogLevel::Error, "CRITICAL: " + message, kTag);
            throw FetchtagError(ErrorKind::RestoreFailed, Stage::Mutating, message);
        }
        remove_file_logged(*attempt.backup, kTag);
    }

    attempt.backup.reset();
    attempt.transition(MutationPhase::RolledBack);
    Logger::log(LogLevel::Info, "Restored original " + name, kTag);
    if (bus_) bus_->publish(MutationRolledBackEvent{attempt.target, cause});
    throw FetchtagError(cause);
}

TagSummary TagMutationEngine::summary(const fs::path& path) const noexcept {
    TagSummary out;
    try {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (!ec) out.file_size = human_size(size);

        if (!validate(path)) return out;

        const TagLib::MPEG::File file(path.c_str());
        const TagLib::PropertyMap props = file.properties();
        out.artist = property_value(props, kArtistKey);
        out.title = property_value(props, kTitleKey);
        out.album = property_value(props, kAlbumKey);
        out.track = property_value(props, kTrackKey);
        if (const auto* audio = file.audioProperties()) {
            out.duration = format_duration(audio->lengthInSeconds());
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Cannot summarize " + path.filename().string() + ": " + e.what(), kTag);
    }
    return out;
}

} // namespace fetchtag
