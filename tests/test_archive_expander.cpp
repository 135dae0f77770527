#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "relay/archive_expander.hpp"
#include "testing.hpp"

#include <algorithm>
#include <filesystem>
#include <random>

namespace relay {
namespace {

std::string RandomBytes(size_t n, unsigned seed) {
    std::mt19937 gen(seed);
    std::string out(n, '\0');
    for (auto& c : out) c = static_cast<char>(gen() & 0xFF);
    return out;
}

size_t CountFiles(const std::string& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return 0;
    return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                             std::filesystem::directory_iterator{}));
}

class ArchiveExpanderTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::string archive = tmp.Join("bundle.bin");
    std::string dest = tmp.Join("extracted");
    ArchiveExpander expander;
};

TEST_F(ArchiveExpanderTest, ExpandsFlatAndRemovesArchive) {
    testutil::WriteFile(archive,
                        testutil::BuildZip({
                            {.path = "docs/", .contents = "", .file_type = AE_IFDIR},
                            {.path = "docs/readme.txt", .contents = "read me"},
                            {.path = "img/photo.jpg", .contents = testutil::PatternBytes(70000)},
                            {.path = "top.bin", .contents = ""},
                        }));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    ASSERT_EQ(members.size(), 3u);
    EXPECT_EQ(members[0].name, "readme.txt");
    EXPECT_EQ(members[0].archive_name, "docs/readme.txt");
    EXPECT_EQ(members[0].path, dest + "/readme.txt");
    EXPECT_EQ(members[1].name, "photo.jpg");
    EXPECT_EQ(members[1].size, 70000u);
    EXPECT_EQ(members[2].name, "top.bin");
    EXPECT_EQ(members[2].size, 0u);

    EXPECT_EQ(testutil::ReadFile(members[0].path), "read me");
    EXPECT_EQ(testutil::ReadFile(members[1].path), testutil::PatternBytes(70000));
    EXPECT_FALSE(testutil::Exists(archive));
    EXPECT_EQ(CountFiles(dest), 3u);
}

TEST_F(ArchiveExpanderTest, SameNameInDifferentDirectoriesIsDisambiguated) {
    testutil::WriteFile(archive,
                        testutil::BuildZip({
                            {.path = "a/readme.txt", .contents = "first"},
                            {.path = "b/readme.txt", .contents = "second"},
                        }));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_EQ(members.size(), 2u);

    const std::string alt = "readme~" + Sha256Hex(std::string_view("b/readme.txt")).substr(0, 8) + ".txt";
    EXPECT_EQ(ArchiveExpander::DisambiguatedName("readme.txt", "b/readme.txt"), alt);
    EXPECT_EQ(members[0].name, "readme.txt");
    EXPECT_EQ(members[1].name, alt);
    EXPECT_EQ(testutil::ReadFile(members[0].path), "first");
    EXPECT_EQ(testutil::ReadFile(members[1].path), "second");
}

TEST_F(ArchiveExpanderTest, UnresolvableCollisionFailsAndLeavesNothing) {
    const std::string alt = ArchiveExpander::DisambiguatedName("f.txt", "y/f.txt");
    testutil::WriteFile(archive,
                        testutil::BuildZip({
                            {.path = "x/f.txt", .contents = "1"},
                            {.path = alt, .contents = "2"},
                            {.path = "y/f.txt", .contents = "3"},
                        }));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCollision);
    EXPECT_TRUE(members.empty());
    EXPECT_EQ(CountFiles(dest), 0u);
    EXPECT_TRUE(testutil::Exists(archive));
}

TEST_F(ArchiveExpanderTest, PathEscapeIsCorrupt) {
    testutil::WriteFile(archive,
                        testutil::BuildZip({
                            {.path = "ok.txt", .contents = "fine"},
                            {.path = "../evil.txt", .contents = "nope"},
                        }));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCorrupt);
    EXPECT_EQ(CountFiles(dest), 0u);
    EXPECT_FALSE(testutil::Exists(tmp.Join("evil.txt")));
    EXPECT_TRUE(testutil::Exists(archive));
}

TEST_F(ArchiveExpanderTest, TruncatedArchiveIsCorruptWithoutPartialMembers) {
    auto zip = testutil::BuildZip({
        {.path = "small.txt", .contents = "complete member"},
        {.path = "big.bin", .contents = RandomBytes(256 * 1024, 42)},
    });
    zip.resize(zip.size() / 2);
    testutil::WriteFile(archive, zip);

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCorrupt);
    EXPECT_TRUE(members.empty());
    EXPECT_EQ(CountFiles(dest), 0u);
    EXPECT_FALSE(testutil::Exists(dest + ".partial"));
    EXPECT_TRUE(testutil::Exists(archive));
}

TEST_F(ArchiveExpanderTest, NonArchiveBytesAreCorrupt) {
    testutil::WriteFile(archive, std::string("PK\x03\x04 this is not really a zip file at all"));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCorrupt);
}

TEST_F(ArchiveExpanderTest, MemberNamedLikeInProgressFileDoesNotCollide) {
    testutil::WriteFile(archive,
                        testutil::BuildZip({
                            {.path = "x.partial", .contents = "first"},
                            {.path = "x", .contents = "second"},
                        }));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0].name, "x.partial");
    EXPECT_EQ(members[1].name, "x");
    EXPECT_EQ(testutil::ReadFile(dest + "/x.partial"), "first");
    EXPECT_EQ(testutil::ReadFile(dest + "/x"), "second");
    EXPECT_EQ(CountFiles(dest), 2u);
    EXPECT_FALSE(testutil::Exists(dest + ".partial"));
}

TEST_F(ArchiveExpanderTest, ExistingFileInDestinationIsNeverOverwritten) {
    std::filesystem::create_directories(dest);
    testutil::WriteFile(dest + "/keep.txt", std::string("original"));
    testutil::WriteFile(archive, testutil::BuildZip({{.path = "keep.txt", .contents = "replacement"}}));

    std::vector<ExpandedMember> members;
    auto res = expander.Expand(archive, dest, members);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCollision);
    EXPECT_EQ(testutil::ReadFile(dest + "/keep.txt"), "original");
}

} // namespace
} // namespace relay
