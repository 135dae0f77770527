#include <gtest/gtest.h>

#include "relay/fetcher.hpp"
#include "testing.hpp"

#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace relay {
namespace {

// One in-memory object; Download may stop halfway with a failure.
class StubStorage final : public IStorageClient {
  public:
    std::string name = "report.pdf";
    std::string bytes = "0123456789abcdef";
    size_t fail_after = 0; // bytes written before failing; 0 = never
    std::chrono::milliseconds delay{0};
    int resolve_calls = 0;
    int download_calls = 0;

    Result Resolve(const SourceLink& link, RemoteObject& out) override {
        ++resolve_calls;
        out.name = name;
        out.size = bytes.size();
        out.download_url = "memory://" + link.id;
        out.key = link.key;
        return Result::Ok();
    }

    Result Download(const RemoteObject&, IWriter& out, net::Deadline) override {
        ++download_calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        const size_t n = fail_after > 0 ? fail_after : bytes.size();
        auto r = out.WriteAll(
            std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(bytes.data()), n));
        if (!r.is_ok()) return r;
        if (fail_after > 0) return Result::Fail(ErrorKind::DownloadFailure, "connection reset");
        return Result::Ok();
    }
};

class FetcherTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    StubStorage storage;
    Fetcher fetcher{storage, nullptr, {.poll_interval = std::chrono::milliseconds(5)}};
};

TEST_F(FetcherTest, MalformedUriFailsBeforeAnyIo) {
    const std::string dest = tmp.Join("fetch");
    FetchedObject out;
    auto res = fetcher.Fetch(std::string_view("ftp://mega.nz/file/abc#k"), dest, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::LinkInvalid);
    EXPECT_EQ(storage.resolve_calls, 0);
    EXPECT_FALSE(testutil::Exists(dest));
    EXPECT_TRUE(out.path.empty());
}

TEST_F(FetcherTest, FolderLinkIsUnsupported) {
    FetchedObject out;
    auto res = fetcher.Fetch(std::string_view("https://mega.nz/folder/abc#k"), tmp.Join("fetch"), out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::UnsupportedSource);
    EXPECT_EQ(storage.resolve_calls, 0);
}

TEST_F(FetcherTest, FailedDownloadRemovesPartialFile) {
    storage.fail_after = 5;
    const std::string dest = tmp.Join("fetch");

    FetchedObject out;
    auto res = fetcher.Fetch(std::string_view("https://mega.nz/file/abc#k"), dest, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::DownloadFailure);
    EXPECT_EQ(storage.download_calls, 1);
    EXPECT_FALSE(testutil::Exists(dest + "/report.pdf"));
    EXPECT_TRUE(out.path.empty());
}

TEST_F(FetcherTest, SuccessFillsSizeAndElapsed) {
    storage.delay = std::chrono::milliseconds(20);
    const std::string dest = tmp.Join("fetch");

    FetchedObject out;
    auto res = fetcher.Fetch(std::string_view("https://mega.nz/file/abc#k"), dest, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(out.name, "report.pdf");
    EXPECT_EQ(out.path, dest + "/report.pdf");
    EXPECT_EQ(out.size, storage.bytes.size());
    EXPECT_GE(out.elapsed.count(), 0.02);
    EXPECT_EQ(testutil::ReadFile(out.path), storage.bytes);
}

TEST_F(FetcherTest, ExistingFileIsNotOverwritten) {
    const std::string dest = tmp.Join("fetch");
    fs::create_directories(dest);
    testutil::WriteFile(dest + "/report.pdf", std::string("keep"));

    FetchedObject out;
    auto res = fetcher.Fetch(std::string_view("https://mega.nz/file/abc#k"), dest, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(storage.download_calls, 0);
    EXPECT_EQ(testutil::ReadFile(dest + "/report.pdf"), "keep");
}

} // namespace
} // namespace relay
