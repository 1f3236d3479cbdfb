#include <gtest/gtest.h>

#include <stdexcept>

#include "core/fs/file_conflict.hpp"
#include "test_helpers.hpp"

using namespace laxy;
using laxy::fs::ConflictAction;
using laxy::fs::ConflictInfo;
using laxy::fs::ConflictKind;
using laxy::fs::ConflictResolver;
using laxy::test_helpers::makeContent;
using laxy::test_helpers::readAll;
using laxy::test_helpers::ScopedTempDir;
using laxy::test_helpers::writeFile;

namespace {

ConflictInfo makeConflict(ConflictKind kind = ConflictKind::Exists) {
    ConflictInfo info;
    info.source = "/src/report.txt";
    info.destination = "/dst/report.txt";
    info.kind = kind;
    info.source_size = 100;
    info.destination_size = 100;
    info.source_mtime = std::chrono::system_clock::time_point(std::chrono::hours(1000));
    info.destination_mtime = info.source_mtime;
    return info;
}

config::ConflictSettings rules(bool newer, bool larger, bool backup) {
    config::ConflictSettings settings;
    settings.overwrite_newer = newer;
    settings.overwrite_larger = larger;
    settings.backup_on_overwrite = backup;
    return settings;
}

}  // namespace

TEST(ConflictResolver, NewerSourceOverwrites) {
    ConflictResolver resolver(rules(true, false, false));
    auto conflict = makeConflict();
    conflict.source_mtime += std::chrono::minutes(5);

    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Overwrite);
}

TEST(ConflictResolver, LargerSourceOverwrites) {
    ConflictResolver resolver(rules(false, true, false));
    auto conflict = makeConflict();
    conflict.source_size = 200;

    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Overwrite);
}

TEST(ConflictResolver, BackupWhenNoOverwriteRuleMatches) {
    ConflictResolver resolver(rules(true, true, true));
    auto conflict = makeConflict();
    conflict.source_mtime -= std::chrono::minutes(5);
    conflict.source_size = 50;

    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Backup);
}

TEST(ConflictResolver, RenameIsTheFinalFallback) {
    ConflictResolver resolver(rules(false, false, false));

    EXPECT_EQ(resolver.resolve(makeConflict()), ConflictAction::Rename);
}

TEST(ConflictResolver, PermissionConflictSkipsBeforeOtherRules) {
    ConflictResolver resolver(rules(true, true, true));
    auto conflict = makeConflict(ConflictKind::Permission);
    conflict.source_mtime += std::chrono::hours(1);

    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Skip);
}

TEST(ConflictResolver, RegisteredActionWins) {
    ConflictResolver resolver(rules(true, true, true));
    auto conflict = makeConflict(ConflictKind::Permission);
    resolver.registerAction(conflict.source, conflict.destination, ConflictAction::Overwrite);

    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Overwrite);

    resolver.clearRegisteredActions();
    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Skip);
}

TEST(ConflictResolver, RegisteredActionMatchesNormalizedPaths) {
    ConflictResolver resolver;
    resolver.registerAction("/src/./report.txt", "/dst/sub/../report.txt", ConflictAction::Skip);

    EXPECT_EQ(resolver.resolve(makeConflict()), ConflictAction::Skip);
}

TEST(ConflictResolver, OtherConflictAsksCallback) {
    ConflictResolver resolver;
    auto conflict = makeConflict(ConflictKind::Other);

    EXPECT_EQ(resolver.resolve(conflict), ConflictAction::Ask);
    EXPECT_EQ(resolver.resolve(conflict, [](const ConflictInfo&) {
        return std::optional<ConflictAction>(ConflictAction::Rename);
    }),
              ConflictAction::Rename);
}

TEST(ConflictResolver, UnansweredAskBecomesSkip) {
    ConflictResolver resolver;
    auto conflict = makeConflict(ConflictKind::Other);

    EXPECT_EQ(resolver.resolve(conflict,
                               [](const ConflictInfo&) { return std::optional<ConflictAction>{}; }),
              ConflictAction::Skip);
    EXPECT_EQ(resolver.resolve(conflict,
                               [](const ConflictInfo&) -> std::optional<ConflictAction> {
                                   throw std::runtime_error("dialog closed");
                               }),
              ConflictAction::Skip);
}

TEST(ConflictResolver, NonStandardThrowFromCallbackBecomesSkip) {
    ConflictResolver resolver;
    auto conflict = makeConflict(ConflictKind::Other);

    EXPECT_EQ(resolver.resolve(conflict,
                               [](const ConflictInfo&) -> std::optional<ConflictAction> {
                                   throw 42;
                               }),
              ConflictAction::Skip);
}

TEST(ConflictResolver, BackupPathFormat) {
    auto now = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    EXPECT_EQ(ConflictResolver::backupPath("/dst/report.txt", now),
              std::filesystem::path("/dst/report.backup.1700000000.txt"));
    EXPECT_EQ(ConflictResolver::backupPath("/dst/Makefile", now),
              std::filesystem::path("/dst/Makefile.backup.1700000000"));
}

TEST(ConflictResolver, AvailableNameSkipsTakenNames) {
    ScopedTempDir tmp;
    writeFile(tmp.join("photo.jpg"), "0");
    writeFile(tmp.join("photo_1.jpg"), "1");

    ConflictResolver resolver;
    EXPECT_EQ(resolver.availableName(tmp.join("photo.jpg")), tmp.join("photo_2.jpg"));
}

TEST(ConflictResolver, ApplyBackupMovesDestinationAside) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src/data.txt"), "new");
    writeFile(tmp.join("dst/data.txt"), "old");

    ConflictResolver resolver;
    auto conflict = fs::detectConflict(tmp.join("src/data.txt"), tmp.join("dst/data.txt"));
    ASSERT_TRUE(conflict.has_value());

    auto applied = resolver.applyAction(*conflict, ConflictAction::Backup);
    ASSERT_TRUE(applied.has_value());
    ASSERT_TRUE(applied->has_value());
    EXPECT_EQ(**applied, tmp.join("dst/data.txt"));
    EXPECT_FALSE(std::filesystem::exists(tmp.join("dst/data.txt")));

    size_t backups = 0;
    for (const auto& entry : std::filesystem::directory_iterator(tmp.join("dst"))) {
        auto name = entry.path().filename().string();
        if (name.starts_with("data.backup.") && name.ends_with(".txt")) {
            EXPECT_EQ(readAll(entry.path()), "old");
            ++backups;
        }
    }
    EXPECT_EQ(backups, 1u);
}

TEST(ConflictResolver, ApplySkipWritesNothing) {
    ConflictResolver resolver;
    auto applied = resolver.applyAction(makeConflict(), ConflictAction::Skip);

    ASSERT_TRUE(applied.has_value());
    EXPECT_FALSE(applied->has_value());
}

TEST(ConflictDetection, FreeDestinationHasNoConflict) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "a");

    EXPECT_FALSE(fs::detectConflict(tmp.join("a.txt"), tmp.join("b.txt")).has_value());
}

TEST(ConflictDetection, ExistingDestinationReportsSizes) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "four");
    writeFile(tmp.join("b.txt"), "sixsix");

    auto conflict = fs::detectConflict(tmp.join("a.txt"), tmp.join("b.txt"));
    ASSERT_TRUE(conflict.has_value());
    EXPECT_EQ(conflict->kind, ConflictKind::Exists);
    EXPECT_EQ(conflict->source_size, 4u);
    EXPECT_EQ(conflict->destination_size, 6u);
    EXPECT_FALSE(conflict->identical);
}

TEST(ConflictDetection, SampledIdentity) {
    ScopedTempDir tmp;
    auto content = makeContent(20000);
    writeFile(tmp.join("a"), content);
    writeFile(tmp.join("b"), content);
    content[19999] = '!';
    writeFile(tmp.join("c"), content);

    EXPECT_TRUE(fs::areFilesIdentical(tmp.join("a"), tmp.join("b")));
    EXPECT_FALSE(fs::areFilesIdentical(tmp.join("a"), tmp.join("c")));
}

TEST(ConflictDetection, SubdirectoryCheck) {
    ScopedTempDir tmp;
    std::filesystem::create_directories(tmp.join("dir/inner"));
    std::filesystem::create_directories(tmp.join("dir2"));

    EXPECT_TRUE(fs::isSubdirectory(tmp.join("dir"), tmp.join("dir/inner")));
    EXPECT_TRUE(fs::isSubdirectory(tmp.join("dir"), tmp.join("dir/inner/not-yet")));
    EXPECT_TRUE(fs::isSubdirectory(tmp.join("dir"), tmp.join("dir")));
    EXPECT_FALSE(fs::isSubdirectory(tmp.join("dir"), tmp.join("dir2")));
    EXPECT_FALSE(fs::isSubdirectory(tmp.join("dir/inner"), tmp.join("dir")));
}

TEST(ConflictActionNames, ParsesNames) {
    EXPECT_EQ(fs::conflictActionFromString("backup"), ConflictAction::Backup);
    EXPECT_EQ(fs::conflictActionFromString("ask"), ConflictAction::Ask);
    EXPECT_FALSE(fs::conflictActionFromString("merge").has_value());
}
