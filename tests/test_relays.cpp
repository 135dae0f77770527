#include <gtest/gtest.h>

#include "relay/directory_relay.hpp"
#include "relay/mega_client.hpp"
#include "relay/telegram_relay.hpp"
#include "testing.hpp"

#include <atomic>

namespace relay {
namespace {

TEST(DirectoryRelayTest, CopiesFileAndRecordsCaption) {
    testutil::TemporaryDirectory tmp;
    const std::string src = tmp.Join("report.pdf");
    const std::string data = testutil::PatternBytes(300000);
    testutil::WriteFile(src, data);

    DirectoryRelay relay(tmp.Join("outbox"));
    std::atomic<std::uint64_t> sent{0};
    auto res = relay.Send(src, "Part 1/2 of report.pdf", &sent);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(sent.load(), data.size());
    EXPECT_EQ(testutil::ReadFile(tmp.Join("outbox/report.pdf")), data);
    EXPECT_TRUE(testutil::Exists(src));
    EXPECT_EQ(testutil::ReadFile(tmp.Join("outbox/captions.tsv")), "report.pdf\tPart 1/2 of report.pdf\n");
}

TEST(DirectoryRelayTest, CaptionsAppendInDeliveryOrderOnOneLineEach) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("a"), std::string("1"));
    testutil::WriteFile(tmp.Join("b"), std::string("2"));

    DirectoryRelay relay(tmp.Join("outbox"));
    ASSERT_TRUE(relay.Send(tmp.Join("a"), "first\nline", nullptr).is_ok());
    ASSERT_TRUE(relay.Send(tmp.Join("b"), "second\tcaption", nullptr).is_ok());
    EXPECT_EQ(testutil::ReadFile(tmp.Join("outbox/captions.tsv")), "a\tfirst line\nb\tsecond caption\n");
}

TEST(DirectoryRelayTest, MissingSourceFails) {
    testutil::TemporaryDirectory tmp;
    DirectoryRelay relay(tmp.Join("outbox"));
    EXPECT_FALSE(relay.Send(tmp.Join("missing"), "c", nullptr).is_ok());
}

TEST(TelegramRelayTest, ReplyOkIsSuccess) {
    EXPECT_TRUE(TelegramRelay::ParseReply(200, R"({"ok":true,"result":{"message_id":7}})").is_ok());
}

TEST(TelegramRelayTest, ReplyErrorCarriesDescription) {
    auto res = TelegramRelay::ParseReply(413, R"({"ok":false,"error_code":413,"description":"Request Entity Too Large"})");
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::UploadFailure);
    EXPECT_NE(res.msg.find("Request Entity Too Large"), std::string::npos);
}

TEST(TelegramRelayTest, NonJsonReplyIsUploadFailure) {
    auto res = TelegramRelay::ParseReply(502, "<html>Bad Gateway</html>");
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::UploadFailure);
    EXPECT_NE(res.msg.find("502"), std::string::npos);
}

TEST(TelegramRelayTest, MissingCredentialsFailBeforeNetwork) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("f"), std::string("x"));
    TelegramRelay relay({.bot_token = "", .chat_id = "1"});
    auto res = relay.Send(tmp.Join("f"), "c", nullptr);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Config);
}

TEST(MegaClientTest, RecognizesMegaHosts) {
    EXPECT_TRUE(MegaClient::IsMegaHost("mega.nz"));
    EXPECT_TRUE(MegaClient::IsMegaHost("MEGA.co.nz"));
    EXPECT_TRUE(MegaClient::IsMegaHost("www.mega.nz"));
    EXPECT_FALSE(MegaClient::IsMegaHost("notmega.nz"));
    EXPECT_FALSE(MegaClient::IsMegaHost("mega.nz.evil.com"));
    EXPECT_FALSE(MegaClient::IsMegaHost("example.com"));
}

TEST(MegaClientTest, SanitizesFileNames) {
    EXPECT_EQ(MegaClient::SanitizeFileName("movie.mkv"), "movie.mkv");
    EXPECT_EQ(MegaClient::SanitizeFileName("../../etc/passwd"), ".._.._etc_passwd");
    EXPECT_EQ(MegaClient::SanitizeFileName("a\\b\nc"), "a_b_c");
    EXPECT_EQ(MegaClient::SanitizeFileName(".."), "");
}

TEST(MegaClientTest, ResolveRejectsUnsupportedLinksWithoutNetwork) {
    MegaClient client;
    RemoteObject object;

    SourceLink other;
    ASSERT_TRUE(ParseSourceLink("https://example.com/file/abc#def", other).is_ok());
    EXPECT_EQ(client.Resolve(other, object).kind, ErrorKind::UnsupportedSource);

    SourceLink folder;
    ASSERT_TRUE(ParseSourceLink("https://mega.nz/folder/abc#def", folder).is_ok());
    EXPECT_EQ(client.Resolve(folder, object).kind, ErrorKind::UnsupportedSource);

    SourceLink keyless;
    ASSERT_TRUE(ParseSourceLink("https://mega.nz/file/abc", keyless).is_ok());
    EXPECT_EQ(client.Resolve(keyless, object).kind, ErrorKind::LinkInvalid);

    SourceLink short_key;
    ASSERT_TRUE(ParseSourceLink("https://mega.nz/file/abc#AAAA", short_key).is_ok());
    EXPECT_EQ(client.Resolve(short_key, object).kind, ErrorKind::LinkInvalid);
}

} // namespace
} // namespace relay
