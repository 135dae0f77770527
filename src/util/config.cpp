#include "util/config.hpp"

#include "util/config_json_utils.hpp"

namespace relay::config {

Result RelayConfig::LoadFile(const std::string& path, RelayConfig& out) {
    out = RelayConfig{};

    nlohmann::json j;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }
    if (!detail::FillConfigFromJson(j, out, err)) {
        return Result::Fail(ErrorKind::Config, path + ": " + err);
    }
    return out.Validate().Wrap(path);
}

Result RelayConfig::Validate() const {
    if (chunk_size_limit == 0) {
        return Result::Fail(ErrorKind::Config, "ChunkSizeLimit must be greater than zero");
    }
    if (poll_interval_ms == 0) {
        return Result::Fail(ErrorKind::Config, "PollIntervalMs must be greater than zero");
    }
    if (staging_root.empty()) {
        return Result::Fail(ErrorKind::Config, "StagingRoot must not be empty");
    }
    if (outbox.empty() && (telegram.bot_token.empty() || telegram.chat_id.empty())) {
        return Result::Fail(ErrorKind::Config, "either Outbox or Telegram.BotToken and Telegram.ChatId is required");
    }
    return Result::Ok();
}

} // namespace relay::config
