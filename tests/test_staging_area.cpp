#include <gtest/gtest.h>

#include "relay/staging_area.hpp"
#include "testing.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace relay {
namespace {

class FakeSystemOps final : public StagingArea::ISystemOps {
public:
    Result root_result = Result::Ok();
    Result create_result = Result::Ok();
    Result remove_result = Result::Ok();

    mutable int root_calls = 0;
    mutable int create_calls = 0;
    mutable std::vector<std::string> removed;

    Result CreateRoot(std::string_view) const override {
        ++root_calls;
        return root_result;
    }

    Result CreateJobDirectory(std::string_view) const override {
        ++create_calls;
        return create_result;
    }

    Result RemoveTree(std::string_view dir) const override {
        removed.emplace_back(dir);
        return remove_result;
    }
};

TEST(StagingAreaTest, AcquireAndReleaseSuccess) {
    auto ops = std::make_shared<FakeSystemOps>();
    StagingArea staging(ops);

    auto res = StagingArea::Acquire("root", "job-1", staging);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(staging.Held());
    EXPECT_EQ(staging.Dir(), "root/job-1");
    EXPECT_EQ(staging.PathFor("a.bin"), "root/job-1/a.bin");
    EXPECT_EQ(ops->root_calls, 1);
    EXPECT_EQ(ops->create_calls, 1);

    ASSERT_TRUE(staging.Release().is_ok());
    EXPECT_FALSE(staging.Held());
    ASSERT_EQ(ops->removed.size(), 1u);
    EXPECT_EQ(ops->removed[0], "root/job-1");
}

TEST(StagingAreaTest, ReleaseIsIdempotent) {
    auto ops = std::make_shared<FakeSystemOps>();
    StagingArea staging(ops);
    ASSERT_TRUE(StagingArea::Acquire("root", "job-2", staging).is_ok());

    EXPECT_TRUE(staging.Release().is_ok());
    EXPECT_TRUE(staging.Release().is_ok());
    EXPECT_EQ(ops->removed.size(), 1u);
}

TEST(StagingAreaTest, DestructorReleases) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        StagingArea staging(ops);
        ASSERT_TRUE(StagingArea::Acquire("root", "job-3", staging).is_ok());
    }
    ASSERT_EQ(ops->removed.size(), 1u);
}

TEST(StagingAreaTest, ExistingJobDirectoryIsRefused) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->create_result = Result::FromErrno(EEXIST, "mkdir failed");
    StagingArea staging(ops);

    auto res = StagingArea::Acquire("root", "job-4", staging);
    ASSERT_FALSE(res.is_ok());
    EXPECT_FALSE(staging.Held());
    EXPECT_TRUE(ops->removed.empty());
}

TEST(StagingAreaTest, RemoveFailureKeepsHandle) {
    auto ops = std::make_shared<FakeSystemOps>();
    StagingArea staging(ops);
    ASSERT_TRUE(StagingArea::Acquire("root", "job-5", staging).is_ok());

    ops->remove_result = Result::Fail(ErrorKind::Io, "busy");
    auto res = staging.Release();
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.msg, "busy");
    EXPECT_TRUE(staging.Held());

    ops->remove_result = Result::Ok();
    EXPECT_TRUE(staging.Release().is_ok());
}

TEST(StagingAreaTest, RejectsJobIdThatEscapesRoot) {
    auto ops = std::make_shared<FakeSystemOps>();
    StagingArea staging(ops);
    EXPECT_FALSE(StagingArea::Acquire("root", "../x", staging).is_ok());
    EXPECT_FALSE(StagingArea::Acquire("root", "..", staging).is_ok());
    EXPECT_FALSE(StagingArea::Acquire("root", "", staging).is_ok());
    EXPECT_EQ(ops->create_calls, 0);
}

TEST(StagingAreaTest, MoveTransfersOwnership) {
    auto ops = std::make_shared<FakeSystemOps>();
    StagingArea original(ops);
    ASSERT_TRUE(StagingArea::Acquire("root", "job-6", original).is_ok());

    StagingArea moved(std::move(original));
    EXPECT_FALSE(original.Held());
    EXPECT_EQ(moved.Dir(), "root/job-6");
    ASSERT_TRUE(moved.Release().is_ok());
    EXPECT_EQ(ops->removed.size(), 1u);
}

TEST(StagingAreaTest, RealFilesystemLifecycle) {
    testutil::TemporaryDirectory tmp;
    const std::string root = tmp.Join("downloads");
    std::string dir;
    {
        StagingArea staging;
        ASSERT_TRUE(StagingArea::Acquire(root, "job-7", staging).is_ok());
        dir = staging.Dir();
        ASSERT_TRUE(testutil::Exists(dir));
        testutil::WriteFile(staging.PathFor("payload.bin"), std::string("data"));

        // A second job with the same id must not share the directory.
        StagingArea other;
        EXPECT_FALSE(StagingArea::Acquire(root, "job-7", other).is_ok());
    }
    EXPECT_FALSE(testutil::Exists(dir));
    EXPECT_TRUE(testutil::Exists(root));
}

} // namespace
} // namespace relay
