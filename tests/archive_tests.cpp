#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <stop_token>
#include <string>
#include <vector>

#include "core/archive/archive_codec.hpp"
#include "core/archive/seven_zip_library.hpp"
#include "core/cache/metadata_cache.hpp"
#include "test_helpers.hpp"

using namespace laxy;
using laxy::archive::ArchiveCodec;
using laxy::archive::ArchiveError;
using laxy::archive::ArchiveFormat;
using laxy::archive::CompressionLevel;
using laxy::test_helpers::readAll;
using laxy::test_helpers::ScopedTempDir;
using laxy::test_helpers::writeFile;

namespace {

std::vector<uint8_t> bytes(std::initializer_list<uint8_t> values) {
    return std::vector<uint8_t>(values);
}

class ArchiveCodecTest : public ::testing::Test {
protected:
    ScopedTempDir tmp_;
    cache::MetadataCache cache_;
    progress::ProgressTracker tracker_;
    ArchiveCodec codec_{cache_, tracker_};
};

}  // namespace

TEST(ArchiveFormat, ParsesNames) {
    EXPECT_EQ(archive::format_from_string("zip"), ArchiveFormat::Zip);
    EXPECT_EQ(archive::format_from_string("tgz"), ArchiveFormat::TarGz);
    EXPECT_EQ(archive::format_from_string(".tar.xz"), ArchiveFormat::TarXz);
    EXPECT_EQ(archive::format_from_string("SevenZip"), ArchiveFormat::SevenZip);
    EXPECT_FALSE(archive::format_from_string("arj").has_value());
}

TEST(ArchiveFormat, CapabilitiesAndExtensions) {
    EXPECT_TRUE(archive::can_create(ArchiveFormat::Zip));
    EXPECT_FALSE(archive::can_create(ArchiveFormat::Rar));
    EXPECT_FALSE(archive::can_create(ArchiveFormat::Unknown));
    EXPECT_TRUE(archive::is_compressed_tar(ArchiveFormat::TarBz2));
    EXPECT_FALSE(archive::is_compressed_tar(ArchiveFormat::Tar));
    EXPECT_EQ(archive::default_extension(ArchiveFormat::TarGz), ".tar.gz");
    EXPECT_EQ(archive::default_extension(ArchiveFormat::Unknown), "");
    EXPECT_EQ(ArchiveCodec::supportedFormats().size(), 7u);
}

TEST(ArchiveFormat, DetectsFromExtension) {
    EXPECT_EQ(archive::format_from_extension("/x/backup.tar.gz"), ArchiveFormat::TarGz);
    EXPECT_EQ(archive::format_from_extension("/x/BACKUP.ZIP"), ArchiveFormat::Zip);
    EXPECT_EQ(archive::format_from_extension("/x/logs.tar"), ArchiveFormat::Tar);
    EXPECT_EQ(archive::format_from_extension("/x/.zip"), ArchiveFormat::Unknown);
    EXPECT_EQ(archive::format_from_extension("/x/notes.txt"), ArchiveFormat::Unknown);
}

TEST(ArchiveFormat, DetectsFromSignature) {
    EXPECT_EQ(archive::format_from_signature(bytes({'P', 'K', 3, 4, 0})), ArchiveFormat::Zip);
    EXPECT_EQ(archive::format_from_signature(bytes({'P', 'K', 5, 6})), ArchiveFormat::Zip);
    EXPECT_EQ(archive::format_from_signature(bytes({0x1f, 0x8b, 8})), ArchiveFormat::TarGz);
    EXPECT_EQ(archive::format_from_signature(bytes({'B', 'Z', 'h', '9'})), ArchiveFormat::TarBz2);
    EXPECT_EQ(archive::format_from_signature(bytes({0xfd, '7', 'z', 'X', 'Z', 0})),
              ArchiveFormat::TarXz);
    EXPECT_EQ(archive::format_from_signature(bytes({'7', 'z', 0xbc, 0xaf, 0x27, 0x1c})),
              ArchiveFormat::SevenZip);
    EXPECT_EQ(archive::format_from_signature(bytes({'R', 'a', 'r', '!', 0x1a, 0x07, 0})),
              ArchiveFormat::Rar);
    EXPECT_EQ(archive::format_from_signature(bytes({'P', 'K'})), ArchiveFormat::Unknown);

    std::vector<uint8_t> tar(512, 0);
    std::copy_n("ustar", 5, tar.begin() + 257);
    EXPECT_EQ(archive::format_from_signature(tar), ArchiveFormat::Tar);
}

TEST(ArchiveFormat, DetectFormatFallsBackToMagic) {
    ScopedTempDir tmp;
    writeFile(tmp.join("download.bin"), std::string("PK\x03\x04rest", 8));
    writeFile(tmp.join("plain.bin"), "hello");

    EXPECT_EQ(archive::detect_format(tmp.join("download.bin")), ArchiveFormat::Zip);
    EXPECT_EQ(archive::detect_format(tmp.join("plain.bin")), ArchiveFormat::Unknown);
    EXPECT_EQ(archive::detect_format(tmp.join("missing.bin")), ArchiveFormat::Unknown);
}

TEST(ArchiveEntryPath, RejectsEscapingPaths) {
    EXPECT_TRUE(archive::is_safe_entry_path("docs/readme.txt"));
    EXPECT_TRUE(archive::is_safe_entry_path("a/..b/c"));
    EXPECT_FALSE(archive::is_safe_entry_path(""));
    EXPECT_FALSE(archive::is_safe_entry_path("/etc/passwd"));
    EXPECT_FALSE(archive::is_safe_entry_path("\\windows\\system32"));
    EXPECT_FALSE(archive::is_safe_entry_path("C:evil"));
    EXPECT_FALSE(archive::is_safe_entry_path("../outside"));
    EXPECT_FALSE(archive::is_safe_entry_path("docs/../../outside"));
    EXPECT_FALSE(archive::is_safe_entry_path("docs\\..\\outside"));
}

TEST(ArchiveEntryPath, HelpersOnEntriesAndInfo) {
    archive::ArchiveEntry entry;
    entry.path = "docs/sub/readme.txt";
    entry.compressed_size = 25;
    entry.uncompressed_size = 100;
    EXPECT_EQ(entry.parent_path(), "docs/sub");
    EXPECT_DOUBLE_EQ(entry.compression_ratio(), 0.75);

    archive::ArchiveInfo info;
    info.entries.push_back(entry);
    info.file_count = 1;
    info.directory_count = 2;
    EXPECT_EQ(info.total_entries(), 3u);
    EXPECT_NE(info.find_entry("docs/sub/readme.txt"), nullptr);
    EXPECT_EQ(info.find_entry("docs/other.txt"), nullptr);
}

TEST(ArchiveCompression, LevelFromInt) {
    EXPECT_EQ(archive::compression_level_from_int(-3), CompressionLevel::None);
    EXPECT_EQ(archive::compression_level_from_int(2), CompressionLevel::Fastest);
    EXPECT_EQ(archive::compression_level_from_int(5), CompressionLevel::Fast);
    EXPECT_EQ(archive::compression_level_from_int(6), CompressionLevel::Normal);
    EXPECT_EQ(archive::compression_level_from_int(42), CompressionLevel::Best);
}

TEST(ArchiveErrors, MapToEngineKinds) {
    EXPECT_EQ(archive::toErrorKind(ArchiveError::NotFound), ErrorKind::NotFound);
    EXPECT_EQ(archive::toErrorKind(ArchiveError::LibraryNotFound), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(archive::toErrorKind(ArchiveError::UnsafeEntry), ErrorKind::InvalidArgument);
    EXPECT_EQ(archive::toErrorKind(ArchiveError::Cancelled), ErrorKind::Cancelled);
}

TEST_F(ArchiveCodecTest, CreateRejectsUnknownExtension) {
    writeFile(tmp_.join("a.txt"), "a");
    std::vector<std::filesystem::path> inputs{tmp_.join("a.txt")};

    auto created = codec_.create(inputs, tmp_.join("out.bundle"));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code(), ErrorKind::UnsupportedFormat);
}

TEST_F(ArchiveCodecTest, CreateRejectsRar) {
    writeFile(tmp_.join("a.txt"), "a");
    std::vector<std::filesystem::path> inputs{tmp_.join("a.txt")};

    auto created = codec_.create(inputs, tmp_.join("out.rar"));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code(), ErrorKind::UnsupportedFormat);
    EXPECT_FALSE(std::filesystem::exists(tmp_.join("out.rar")));
}

TEST_F(ArchiveCodecTest, CreateRejectsEmptyInput) {
    std::vector<std::filesystem::path> inputs;
    auto created = codec_.create(inputs, tmp_.join("out.zip"));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code(), ErrorKind::InvalidArgument);
}

TEST_F(ArchiveCodecTest, MissingArchiveIsNotFound) {
    auto listed = codec_.listContents(tmp_.join("absent.zip"));
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error(), ArchiveError::NotFound);

    auto described = codec_.info(tmp_.join("absent.zip"));
    ASSERT_FALSE(described.has_value());
    EXPECT_EQ(described.error(), ArchiveError::NotFound);

    auto extracted = codec_.extract(tmp_.join("absent.zip"), tmp_.join("out"));
    ASSERT_FALSE(extracted.has_value());
    EXPECT_EQ(extracted.error().code(), ErrorKind::NotFound);
}

TEST_F(ArchiveCodecTest, ExtractIntoFileIsInvalid) {
    writeFile(tmp_.join("blocker"), "x");
    auto extracted = codec_.extract(tmp_.join("absent.zip"), tmp_.join("blocker"));
    ASSERT_FALSE(extracted.has_value());
    EXPECT_EQ(extracted.error().code(), ErrorKind::InvalidArgument);
}

TEST_F(ArchiveCodecTest, ZipRoundTrip) {
    if (!codec_.isAvailable()) {
        GTEST_SKIP() << "7z.so not installed";
    }

    writeFile(tmp_.join("docs/readme.txt"), "read me");
    writeFile(tmp_.join("docs/sub/data.bin"), test_helpers::makeContent(4096));
    writeFile(tmp_.join("single.txt"), "single");
    std::vector<std::filesystem::path> inputs{tmp_.join("docs"), tmp_.join("single.txt")};

    auto archive_path = tmp_.join("bundle.zip");
    auto created = codec_.create(inputs, archive_path);
    ASSERT_TRUE(created.has_value());
    EXPECT_TRUE(created->success);
    EXPECT_EQ(created->message, "Created bundle.zip with 3 files");
    EXPECT_EQ(codec_.detectFormat(archive_path), ArchiveFormat::Zip);
    EXPECT_TRUE(codec_.test(archive_path).has_value());

    auto entries = codec_.listContents(archive_path);
    ASSERT_TRUE(entries.has_value());
    auto has = [&entries](std::string_view path) {
        return std::ranges::any_of(*entries, [path](const archive::ArchiveEntry& e) {
            return !e.is_directory && e.path == path;
        });
    };
    EXPECT_TRUE(has("docs/readme.txt"));
    EXPECT_TRUE(has("docs/sub/data.bin"));
    EXPECT_TRUE(has("single.txt"));

    auto out = tmp_.join("out");
    auto extracted = codec_.extract(archive_path, out);
    ASSERT_TRUE(extracted.has_value());
    EXPECT_TRUE(extracted->success);
    EXPECT_EQ(extracted->items_completed, 3u);
    EXPECT_EQ(readAll(out / "docs/readme.txt"), "read me");
    EXPECT_EQ(readAll(out / "docs/sub/data.bin"), test_helpers::makeContent(4096));
    EXPECT_EQ(readAll(out / "single.txt"), "single");
}

class ArchiveRoundTripTest : public ArchiveCodecTest,
                             public ::testing::WithParamInterface<ArchiveFormat> {};

TEST_P(ArchiveRoundTripTest, ExtractRestoresContent) {
    if (!codec_.isAvailable()) {
        GTEST_SKIP() << "7z.so not installed";
    }

    auto format = GetParam();
    writeFile(tmp_.join("tree/a.txt"), "alpha");
    writeFile(tmp_.join("tree/nested/b.bin"), test_helpers::makeContent(20000, 'k'));
    std::vector<std::filesystem::path> inputs{tmp_.join("tree")};

    auto archive_path = tmp_.join("out/tree" + std::string(archive::default_extension(format)));
    auto created = codec_.create(inputs, archive_path, format, CompressionLevel::Fast);
    ASSERT_TRUE(created.has_value());
    ASSERT_TRUE(created->success) << created->message;
    EXPECT_EQ(codec_.detectFormat(archive_path), format);

    auto described = codec_.info(archive_path);
    ASSERT_TRUE(described.has_value());
    EXPECT_EQ(described->file_count, 2u);

    auto extracted = codec_.extract(archive_path, tmp_.join("restored"));
    ASSERT_TRUE(extracted.has_value());
    ASSERT_TRUE(extracted->success) << extracted->message;
    EXPECT_EQ(readAll(tmp_.join("restored/tree/a.txt")), "alpha");
    EXPECT_EQ(readAll(tmp_.join("restored/tree/nested/b.bin")),
              test_helpers::makeContent(20000, 'k'));
}

INSTANTIATE_TEST_SUITE_P(WritableFormats, ArchiveRoundTripTest,
                         ::testing::Values(ArchiveFormat::Zip, ArchiveFormat::Tar,
                                           ArchiveFormat::TarGz, ArchiveFormat::TarBz2,
                                           ArchiveFormat::TarXz, ArchiveFormat::SevenZip),
                         [](const ::testing::TestParamInfo<ArchiveFormat>& info) {
                             switch (info.param) {
                             case ArchiveFormat::Zip:
                                 return std::string("Zip");
                             case ArchiveFormat::Tar:
                                 return std::string("Tar");
                             case ArchiveFormat::TarGz:
                                 return std::string("TarGz");
                             case ArchiveFormat::TarBz2:
                                 return std::string("TarBz2");
                             case ArchiveFormat::TarXz:
                                 return std::string("TarXz");
                             case ArchiveFormat::SevenZip:
                                 return std::string("SevenZip");
                             default:
                                 return std::string("Other");
                             }
                         });

TEST_F(ArchiveCodecTest, CancelledCreateLeavesNoArchive) {
    writeFile(tmp_.join("big.bin"), test_helpers::makeContent(1 << 20));
    std::vector<std::filesystem::path> inputs{tmp_.join("big.bin")};
    std::stop_source stop;
    stop.request_stop();
    fs::OperationControl control;
    control.stop_token = stop.get_token();
    control.operation_id = "archive-cancel";

    auto created = codec_.create(inputs, tmp_.join("big.7z"), ArchiveFormat::Unknown,
                                 CompressionLevel::Best, control);
    ASSERT_TRUE(created.has_value());
    EXPECT_TRUE(created->cancelled);
    EXPECT_FALSE(std::filesystem::exists(tmp_.join("big.7z")));

    auto record = tracker_.get("archive-cancel");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, OperationStatus::Cancelled);
}

TEST_F(ArchiveCodecTest, CancelledCompressedTarExtractionWritesNothing) {
    if (!codec_.isAvailable()) {
        GTEST_SKIP() << "7z.so not installed";
    }

    writeFile(tmp_.join("tree/big.bin"), test_helpers::makeContent(1 << 20, 'z'));
    std::vector<std::filesystem::path> inputs{tmp_.join("tree")};
    auto archive_path = tmp_.join("tree.tar.gz");
    auto created = codec_.create(inputs, archive_path, ArchiveFormat::TarGz, CompressionLevel::Fast);
    ASSERT_TRUE(created.has_value());
    ASSERT_TRUE(created->success) << created->message;

    std::stop_source stop;
    stop.request_stop();
    fs::OperationControl control;
    control.stop_token = stop.get_token();
    control.operation_id = "extract-cancel";

    auto extracted = codec_.extract(archive_path, tmp_.join("restored"), control);
    ASSERT_TRUE(extracted.has_value());
    EXPECT_TRUE(extracted->cancelled);
    EXPECT_FALSE(extracted->success);
    EXPECT_EQ(extracted->message, "Extraction cancelled");
    EXPECT_FALSE(std::filesystem::exists(tmp_.join("restored/tree/big.bin")));

    auto record = tracker_.get("extract-cancel");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, OperationStatus::Cancelled);
}

TEST_F(ArchiveCodecTest, CompressedTarExtractionCompletesTrackedJob) {
    if (!codec_.isAvailable()) {
        GTEST_SKIP() << "7z.so not installed";
    }

    writeFile(tmp_.join("tree/big.bin"), test_helpers::makeContent(1 << 20, 'q'));
    std::vector<std::filesystem::path> inputs{tmp_.join("tree")};
    auto archive_path = tmp_.join("tree.tar.xz");
    auto created = codec_.create(inputs, archive_path, ArchiveFormat::TarXz, CompressionLevel::Fast);
    ASSERT_TRUE(created.has_value());
    ASSERT_TRUE(created->success) << created->message;

    fs::OperationControl control;
    control.operation_id = "extract-two-pass";
    int notifications = 0;
    control.observer = [&notifications](const progress::OperationProgress&) { ++notifications; };

    auto extracted = codec_.extract(archive_path, tmp_.join("restored"), control);
    ASSERT_TRUE(extracted.has_value());
    ASSERT_TRUE(extracted->success) << extracted->message;
    EXPECT_EQ(readAll(tmp_.join("restored/tree/big.bin")), test_helpers::makeContent(1 << 20, 'q'));

    auto record = tracker_.get("extract-two-pass");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, OperationStatus::Completed);
    EXPECT_GE(record->total_bytes, uint64_t{1} << 20);
    EXPECT_EQ(record->processed_files, 1u);
    EXPECT_GT(notifications, 0);
}
