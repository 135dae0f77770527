#include <gtest/gtest.h>

#include "relay/archive_path_policy.hpp"

namespace relay {

TEST(ArchivePathPolicyTest, NormalizesSafeEntryPath) {
    std::string out;
    auto res = ArchivePathPolicy::NormalizeEntryPath("./dir//file.txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "dir/file.txt");
}

TEST(ArchivePathPolicyTest, RejectsParentEscape) {
    std::string out;
    auto res = ArchivePathPolicy::NormalizeEntryPath("../escape.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCorrupt);
    EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);
}

TEST(ArchivePathPolicyTest, RejectsEmbeddedParentSegment) {
    std::string out;
    auto res = ArchivePathPolicy::NormalizeEntryPath("a/../../b.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveCorrupt);
}

TEST(ArchivePathPolicyTest, CurrentDirectoryEntryIsEmpty) {
    std::string out = "junk";
    auto res = ArchivePathPolicy::NormalizeEntryPath("./", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.empty());
}

} // namespace relay
