#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(relay::NormalizeArchivePath("./docs/readme.txt"), "docs/readme.txt");
    EXPECT_EQ(relay::NormalizeArchivePath("/photos//2024///a.jpg"), "photos/2024/a.jpg");
    EXPECT_EQ(relay::NormalizeArchivePath("dir\\sub\\file.bin"), "dir/sub/file.bin");
    EXPECT_EQ(relay::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, LastSegment) {
    EXPECT_EQ(relay::LastSegment("a/b/c.txt"), "c.txt");
    EXPECT_EQ(relay::LastSegment("c.txt"), "c.txt");
    EXPECT_EQ(relay::LastSegment("dir/"), "dir");
    EXPECT_EQ(relay::LastSegment(""), "");
}

TEST(PathUtilsTest, SplitExtension) {
    EXPECT_EQ(relay::SplitExtension("movie.mkv"), std::make_pair(std::string("movie"), std::string(".mkv")));
    EXPECT_EQ(relay::SplitExtension("a.tar.gz"), std::make_pair(std::string("a.tar"), std::string(".gz")));
    EXPECT_EQ(relay::SplitExtension("README"), std::make_pair(std::string("README"), std::string()));
    EXPECT_EQ(relay::SplitExtension(".bashrc"), std::make_pair(std::string(".bashrc"), std::string()));
}
