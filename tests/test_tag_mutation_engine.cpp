//
// Created by Giuseppe Francione on 16/10/26.
//

#include <gtest/gtest.h>
#include <stdexcept>
#include "test_support.hpp"
#include "../libfetchtag/include/event_bus.hpp"
#include "../libfetchtag/include/events.hpp"
#include "../libfetchtag/include/tag_mutation_engine.hpp"

using namespace fetchtag;
using fetchtag::test::TempDir;
namespace fs = std::filesystem;

namespace {

MetadataFields new_fields() {
    return MetadataFields{"  New Artist ", "New Title", "New Album", 7};
}

// damages the file, then fails like a crashed writer would
class CorruptingEngine : public TagMutationEngine {
public:
    using TagMutationEngine::TagMutationEngine;

protected:
    void write_tags(const fs::path& path, const MetadataFields&) override {
        test::write_bytes(path, std::vector<char>(100, '\0'));
        throw std::runtime_error("simulated writer crash");
    }
};

// damages the file but reports success
class SilentCorruptingEngine : public TagMutationEngine {
public:
    using TagMutationEngine::TagMutationEngine;

protected:
    void write_tags(const fs::path& path, const MetadataFields&) override {
        test::write_bytes(path, std::vector<char>(4096, '\0'));
    }
};

// removes the backup before failing, so nothing can be restored
class BackupLosingEngine : public TagMutationEngine {
public:
    using TagMutationEngine::TagMutationEngine;

protected:
    void write_tags(const fs::path& path, const MetadataFields&) override {
        for (const auto& b : test::backups_of(path)) fs::remove(b);
        throw FetchtagError(ErrorKind::MutationFailed, Stage::Mutating, "simulated save failure");
    }
};

class FullDiskEngine : public TagMutationEngine {
public:
    using TagMutationEngine::TagMutationEngine;
    std::optional<std::uintmax_t> space;

protected:
    std::optional<std::uintmax_t> available_space_for(const fs::path&) const override {
        return space;
    }
};

}

TEST(MutationAttempt, FollowsThePhaseMachine) {
    MutationAttempt a;
    a.transition(MutationPhase::Validated);
    a.transition(MutationPhase::BackedUp);
    a.transition(MutationPhase::Written);
    a.transition(MutationPhase::Verified);
    EXPECT_TRUE(a.succeeded());
    EXPECT_THROW(a.transition(MutationPhase::RolledBack), std::logic_error);
}

TEST(MutationAttempt, RejectsSkippedPhases) {
    MutationAttempt a;
    EXPECT_THROW(a.transition(MutationPhase::BackedUp), std::logic_error);
    a.transition(MutationPhase::Validated);
    EXPECT_THROW(a.transition(MutationPhase::Written), std::logic_error);
    EXPECT_THROW(a.transition(MutationPhase::RolledBack), std::logic_error);

    EXPECT_TRUE(MutationAttempt::is_allowed(MutationPhase::BackedUp, MutationPhase::RolledBack));
    EXPECT_TRUE(MutationAttempt::is_allowed(MutationPhase::Written, MutationPhase::RestoreFailed));
    EXPECT_FALSE(MutationAttempt::is_allowed(MutationPhase::RolledBack, MutationPhase::Verified));
    EXPECT_FALSE(MutationAttempt::is_allowed(MutationPhase::BackedUp, MutationPhase::Verified));
}

TEST(TagMutationEngine, ValidateAcceptsOnlyRealMp3) {
    const TempDir dir;
    const TagMutationEngine engine;

    const auto good = dir / "good.mp3";
    test::write_mp3(good);
    EXPECT_TRUE(engine.validate(good));

    const auto wrong_ext = dir / "good.wav";
    test::write_mp3(wrong_ext);
    EXPECT_FALSE(engine.validate(wrong_ext));

    const auto tiny = dir / "tiny.mp3";
    test::write_mp3(tiny, 1);
    EXPECT_FALSE(engine.validate(tiny));

    const auto junk = dir / "junk.mp3";
    test::write_bytes(junk, std::vector<char>(8192, 'j'));
    EXPECT_FALSE(engine.validate(junk));

    EXPECT_FALSE(engine.validate(dir / "missing.mp3"));
    EXPECT_FALSE(engine.validate(dir.path()));
}

TEST(TagMutationEngine, ReadFieldsReturnsEveryEntry) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);

    const TagMutationEngine engine;
    const auto tags = engine.read_fields(file);
    EXPECT_EQ(tags.at("ARTIST"), "Old Artist");
    EXPECT_EQ(tags.at("COMMENT"), "hello");
    EXPECT_EQ(tags.at("GENRE"), "Ambient");
}

TEST(TagMutationEngine, ReadFieldsRejectsInvalidFile) {
    const TempDir dir;
    const auto junk = dir / "junk.mp3";
    test::write_bytes(junk, std::vector<char>(8192, 'j'));

    const TagMutationEngine engine;
    try {
        (void) engine.read_fields(junk);
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TagValidationFailed);
    }
}

TEST(TagMutationEngine, ApplyFieldsReplacesFourAndKeepsTheRest) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);

    TagMutationEngine engine;
    const auto attempt = engine.apply_fields(file, new_fields());
    EXPECT_EQ(attempt.phase, MutationPhase::Verified);
    EXPECT_FALSE(attempt.backup.has_value());
    EXPECT_TRUE(test::backups_of(file).empty());

    const auto tags = engine.read_fields(file);
    EXPECT_EQ(tags.at("ARTIST"), "New Artist");
    EXPECT_EQ(tags.at("TITLE"), "New Title");
    EXPECT_EQ(tags.at("ALBUM"), "New Album");
    EXPECT_EQ(tags.at("TRACKNUMBER"), "7");
    EXPECT_EQ(tags.at("COMMENT"), "hello");
    EXPECT_EQ(tags.at("GENRE"), "Ambient");
    EXPECT_TRUE(engine.validate(file));
}

TEST(TagMutationEngine, ApplyFieldsOnUntaggedFile) {
    const TempDir dir;
    const auto file = dir / "plain.mp3";
    test::write_mp3(file);

    TagMutationEngine engine;
    (void) engine.apply_fields(file, new_fields());

    const auto s = engine.summary(file);
    EXPECT_EQ(s.artist, "New Artist");
    EXPECT_EQ(s.track, "7");
    EXPECT_FALSE(s.duration.empty());
    EXPECT_EQ(s.file_size.substr(s.file_size.size() - 2), "MB");
}

TEST(TagMutationEngine, InvalidFieldsLeaveTheFileAlone) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);
    const auto before = test::read_bytes(file);

    TagMutationEngine engine;
    try {
        (void) engine.apply_fields(file, MetadataFields{"A", "", "C", 0});
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InputValidation);
        EXPECT_NE(e.error().message.find("Title field cannot be empty."), std::string::npos);
        EXPECT_NE(e.error().message.find("Track number"), std::string::npos);
    }
    EXPECT_EQ(test::read_bytes(file), before);
    EXPECT_TRUE(test::backups_of(file).empty());
}

TEST(TagMutationEngine, InvalidTargetIsRejectedBeforeBackup) {
    const TempDir dir;
    const auto junk = dir / "junk.mp3";
    test::write_bytes(junk, std::vector<char>(8192, 'j'));

    TagMutationEngine engine;
    EXPECT_THROW((void) engine.apply_fields(junk, new_fields()), FetchtagError);
    EXPECT_TRUE(test::backups_of(junk).empty());
}

TEST(TagMutationEngine, WriterFailureRestoresOriginalBytes) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);
    const auto before = test::read_bytes(file);

    EventBus bus;
    int rollbacks = 0;
    bus.subscribe<MutationRolledBackEvent>([&](const MutationRolledBackEvent& e) {
        ++rollbacks;
        EXPECT_EQ(e.path, file);
    });

    CorruptingEngine engine(TagEngineSettings{}, &bus);
    try {
        (void) engine.apply_fields(file, new_fields());
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MutationFailed);
        EXPECT_NE(e.error().message.find("simulated writer crash"), std::string::npos);
    }
    EXPECT_EQ(test::read_bytes(file), before);
    EXPECT_TRUE(test::backups_of(file).empty());
    EXPECT_EQ(rollbacks, 1);
}

TEST(TagMutationEngine, FailedReverificationRestoresOriginalBytes) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);
    const auto before = test::read_bytes(file);

    SilentCorruptingEngine engine;
    try {
        (void) engine.apply_fields(file, new_fields());
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MutationFailed);
    }
    EXPECT_EQ(test::read_bytes(file), before);
    EXPECT_TRUE(test::backups_of(file).empty());
}

TEST(TagMutationEngine, LostBackupIsCritical) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);

    TagEngineSettings settings;
    settings.restore_attempts = 1;
    BackupLosingEngine engine(settings);
    try {
        (void) engine.apply_fields(file, new_fields());
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RestoreFailed);
        EXPECT_TRUE(is_critical(e.kind()));
        EXPECT_FALSE(e.error().retryable);
        EXPECT_NE(e.error().message.find("simulated save failure"), std::string::npos);
    }
}

TEST(TagMutationEngine, InsufficientSpaceFailsBeforeAnyBackup) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);
    const auto before = test::read_bytes(file);

    FullDiskEngine engine;
    engine.space = 1000;
    try {
        (void) engine.apply_fields(file, new_fields());
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BackupFailed);
        EXPECT_NE(e.error().message.find("insufficient disk space"), std::string::npos);
    }
    EXPECT_TRUE(test::backups_of(file).empty());
    EXPECT_EQ(test::read_bytes(file), before);

    engine.space = std::nullopt;
    EXPECT_THROW((void) engine.apply_fields(file, new_fields()), FetchtagError);
    EXPECT_TRUE(test::backups_of(file).empty());
}

TEST(TagMutationEngine, SpaceCheckUsesTheConfiguredFactor) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);
    const auto size = fs::file_size(file);

    FullDiskEngine engine;
    engine.space = size * 2;
    EXPECT_NO_THROW((void) engine.apply_fields(file, new_fields()));
}

TEST(TagMutationEngine, BackupOriginalMakesAVerifiedCopy) {
    const TempDir dir;
    const auto file = dir / "tagged.mp3";
    test::write_tagged_mp3(file);

    TagMutationEngine engine;
    const auto backup = engine.backup_original(file);
    EXPECT_EQ(backup.parent_path(), file.parent_path());
    EXPECT_EQ(test::read_bytes(backup), test::read_bytes(file));
    EXPECT_THROW((void) engine.backup_original(dir / "missing.mp3"), FetchtagError);
}

TEST(TagMutationEngine, SummaryOfMissingFileIsEmpty) {
    const TempDir dir;
    const TagMutationEngine engine;
    const auto s = engine.summary(dir / "missing.mp3");
    EXPECT_TRUE(s.artist.empty());
    EXPECT_TRUE(s.file_size.empty());
}
