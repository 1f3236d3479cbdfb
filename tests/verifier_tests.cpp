#include <gtest/gtest.h>

#include "core/fs/verifier.hpp"
#include "core/util/hash.hpp"
#include "test_helpers.hpp"

using namespace laxy;
using laxy::fs::VerificationPolicy;
using laxy::fs::Verifier;
using laxy::test_helpers::makeContent;
using laxy::test_helpers::ScopedTempDir;
using laxy::test_helpers::writeFile;

TEST(Hash, Sha256KnownVector) {
    auto hex = sha256Hex("abc");
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(*hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hash, FileHashMatchesBufferHash) {
    ScopedTempDir tmp;
    auto content = makeContent(200000);
    writeFile(tmp.join("data.bin"), content);

    auto from_file = sha256File(tmp.join("data.bin"), 4096);
    auto from_buffer = sha256(std::string_view(content));
    ASSERT_TRUE(from_file.has_value());
    ASSERT_TRUE(from_buffer.has_value());
    EXPECT_EQ(*from_file, *from_buffer);
}

TEST(VerificationPolicyTest, ThresholdSelectsHashing) {
    VerificationPolicy policy{config::VerificationMode::FullHashBelowThreshold, 1024};
    EXPECT_TRUE(policy.hashes(1023));
    EXPECT_FALSE(policy.hashes(1024));

    VerificationPolicy always{config::VerificationMode::AlwaysFullHash, 1024};
    EXPECT_TRUE(always.hashes(1u << 30));

    VerificationPolicy size_only{config::VerificationMode::SizeOnly, 1024};
    EXPECT_FALSE(size_only.hashes(1));
}

TEST(Verifier, AcceptsByteIdenticalCopy) {
    ScopedTempDir tmp;
    auto content = makeContent(5000);
    writeFile(tmp.join("a"), content);
    writeFile(tmp.join("b"), content);

    Verifier verifier;
    EXPECT_TRUE(verifier.verify(tmp.join("a"), tmp.join("b")));
}

TEST(Verifier, RejectsSameSizeDifferentContent) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a"), makeContent(5000, 'a'));
    writeFile(tmp.join("b"), makeContent(5000, 'b'));

    Verifier verifier;
    auto checked = verifier.check(tmp.join("a"), tmp.join("b"));
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error(), ErrorKind::VerificationFailed);
}

TEST(Verifier, SizeOnlyAboveThreshold) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a"), makeContent(5000, 'a'));
    writeFile(tmp.join("b"), makeContent(5000, 'b'));

    Verifier verifier(VerificationPolicy{config::VerificationMode::FullHashBelowThreshold, 4096});
    EXPECT_TRUE(verifier.verify(tmp.join("a"), tmp.join("b")));
}

TEST(Verifier, RejectsSizeMismatch) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a"), makeContent(100));
    writeFile(tmp.join("b"), makeContent(99));

    Verifier verifier(VerificationPolicy{config::VerificationMode::SizeOnly, 0});
    auto checked = verifier.check(tmp.join("a"), tmp.join("b"));
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error(), ErrorKind::VerificationFailed);
}

TEST(Verifier, MissingDestinationIsNotFound) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a"), "x");

    Verifier verifier;
    auto checked = verifier.check(tmp.join("a"), tmp.join("missing"));
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error(), ErrorKind::NotFound);
}

TEST(Verifier, IdenticalWithoutHashingRequiresSameMtime) {
    ScopedTempDir tmp;
    auto content = makeContent(100);
    writeFile(tmp.join("a"), content);
    writeFile(tmp.join("b"), content);
    auto mtime = std::filesystem::last_write_time(tmp.join("a"));
    std::filesystem::last_write_time(tmp.join("b"), mtime);

    Verifier verifier(VerificationPolicy{config::VerificationMode::SizeOnly, 0});
    EXPECT_TRUE(verifier.identical(tmp.join("a"), tmp.join("b")));

    std::filesystem::last_write_time(tmp.join("b"), mtime - std::chrono::hours(1));
    EXPECT_FALSE(verifier.identical(tmp.join("a"), tmp.join("b")));
}
