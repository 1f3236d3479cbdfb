#include <gtest/gtest.h>

#include "core/fs/trash.hpp"
#include "test_helpers.hpp"

using namespace laxy;
using laxy::fs::TrashError;
using laxy::fs::TrashOptions;
using laxy::test_helpers::readAll;
using laxy::test_helpers::ScopedTempDir;
using laxy::test_helpers::writeFile;

namespace {

TrashOptions localTrash(const ScopedTempDir& tmp) {
    return TrashOptions{false, tmp.join("Trash")};
}

}  // namespace

TEST(Trash, MovesFileWithInfoRecord) {
    ScopedTempDir tmp;
    writeFile(tmp.join("work/draft.txt"), "words");

    auto trashed = fs::trashFile(tmp.join("work/draft.txt"), localTrash(tmp));
    ASSERT_TRUE(trashed.has_value());
    EXPECT_FALSE(trashed->system_trash);
    EXPECT_EQ(trashed->location, tmp.join("Trash/files/draft.txt"));
    EXPECT_FALSE(std::filesystem::exists(tmp.join("work/draft.txt")));
    EXPECT_EQ(readAll(tmp.join("Trash/files/draft.txt")), "words");

    auto info = readAll(tmp.join("Trash/info/draft.txt.trashinfo"));
    EXPECT_TRUE(info.starts_with("[Trash Info]\n"));
    EXPECT_NE(info.find("Path=" + tmp.join("work/draft.txt").string()), std::string::npos);
    EXPECT_NE(info.find("DeletionDate="), std::string::npos);
}

TEST(Trash, CollidingNamesGetSuffix) {
    ScopedTempDir tmp;
    writeFile(tmp.join("one/report.txt"), "first");
    writeFile(tmp.join("two/report.txt"), "second");

    auto first = fs::trashFile(tmp.join("one/report.txt"), localTrash(tmp));
    auto second = fs::trashFile(tmp.join("two/report.txt"), localTrash(tmp));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(second->location, tmp.join("Trash/files/report_1.txt"));
    EXPECT_EQ(readAll(tmp.join("Trash/files/report.txt")), "first");
    EXPECT_EQ(readAll(tmp.join("Trash/files/report_1.txt")), "second");
    EXPECT_TRUE(std::filesystem::exists(tmp.join("Trash/info/report_1.txt.trashinfo")));
}

TEST(Trash, MovesDirectoryTree) {
    ScopedTempDir tmp;
    writeFile(tmp.join("project/src/main.c"), "int main;");

    auto trashed = fs::trashFile(tmp.join("project"), localTrash(tmp));
    ASSERT_TRUE(trashed.has_value());
    EXPECT_EQ(readAll(tmp.join("Trash/files/project/src/main.c")), "int main;");
}

TEST(Trash, SpecialCharactersArePercentEncoded) {
    ScopedTempDir tmp;
    writeFile(tmp.join("my file.txt"), "x");

    ASSERT_TRUE(fs::trashFile(tmp.join("my file.txt"), localTrash(tmp)).has_value());
    auto info = readAll(tmp.join("Trash/info/my file.txt.trashinfo"));
    EXPECT_NE(info.find("my%20file.txt"), std::string::npos);
}

TEST(Trash, MissingPathIsNotFound) {
    ScopedTempDir tmp;
    auto trashed = fs::trashFile(tmp.join("ghost"), localTrash(tmp));

    ASSERT_FALSE(trashed.has_value());
    EXPECT_EQ(trashed.error(), TrashError::NotFound);
}

TEST(Trash, NoTrashDirectoryIsUnavailable) {
    ScopedTempDir tmp;
    writeFile(tmp.join("file"), "x");

    auto trashed = fs::trashFile(tmp.join("file"), TrashOptions{false, {}});
    ASSERT_FALSE(trashed.has_value());
    EXPECT_EQ(trashed.error(), TrashError::Unavailable);
    EXPECT_TRUE(std::filesystem::exists(tmp.join("file")));
}

TEST(PermanentDelete, RemovesTreeAndCountsEntries) {
    ScopedTempDir tmp;
    writeFile(tmp.join("dir/a"), "a");
    writeFile(tmp.join("dir/sub/b"), "b");

    auto removed = fs::permanentDelete(tmp.join("dir"));
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 4u);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("dir")));
}

TEST(PermanentDelete, MissingPathIsNotFound) {
    ScopedTempDir tmp;
    auto removed = fs::permanentDelete(tmp.join("ghost"));

    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error(), TrashError::NotFound);
}
