#include "relay/telegram_relay.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

namespace relay {

TelegramRelay::TelegramRelay(Options opt)
    : opt_(std::move(opt)),
      http_(net::HttpClient::Options{.failure_kind = ErrorKind::UploadFailure}) {}

Result TelegramRelay::ParseReply(unsigned http_status, const std::string& body) {
    const auto reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return Result::Fail(ErrorKind::UploadFailure,
                            "unexpected reply (HTTP " + std::to_string(http_status) + ")");
    }
    if (reply.value("ok", false)) return Result::Ok();

    std::string description = "HTTP " + std::to_string(http_status);
    if (auto it = reply.find("description"); it != reply.end() && it->is_string()) {
        description = it->get<std::string>();
    }
    return Result::Fail(ErrorKind::UploadFailure, "Telegram refused the document: " + description);
}

Result TelegramRelay::Send(const std::string& path,
                           const std::string& caption,
                           std::atomic<std::uint64_t>* bytes_sent) {
    if (opt_.bot_token.empty() || opt_.chat_id.empty()) {
        return Result::Fail(ErrorKind::Config, "Telegram bot token and chat id are required");
    }

    net::Url url;
    auto url_result = net::Url::Parse("https://" + opt_.api_host + "/bot" + opt_.bot_token + "/sendDocument", url);
    if (!url_result.is_ok()) return Result::Fail(ErrorKind::Config, "bad Telegram API host: " + opt_.api_host);

    const std::vector<net::FormField> fields = {
        {.name = "chat_id", .value = opt_.chat_id},
        {.name = "caption", .value = caption},
    };
    const net::FormFile file{
        .field = "document",
        .path = path,
        .filename = std::string(LastSegment(path)),
    };

    net::HttpResponse resp;
    auto post_result = http_.PostMultipart(url, fields, file, net::DeadlineAfter(opt_.timeout), bytes_sent, resp);
    if (!post_result.is_ok()) return post_result;

    return ParseReply(resp.status, resp.body);
}

} // namespace relay
