#include "util/config_json_utils.hpp"

#include <fstream>

namespace relay::config::detail {

namespace {

// The Get*IfPresent helpers leave `out` alone when the key is missing and
// fail (with `err` set) only when the key is present with the wrong type.

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetObjectIfPresent(const nlohmann::json& j, const char* key, const nlohmann::json*& out, std::string& err) {
    out = nullptr;
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_object()) {
        err = std::string(key) + " must be an object";
        return false;
    }
    out = &*it;
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, RelayConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "StagingRoot", cfg.staging_root, err) ||
        !GetU64IfPresent(j, "ChunkSizeLimit", cfg.chunk_size_limit, err) ||
        !GetU64IfPresent(j, "PollIntervalMs", cfg.poll_interval_ms, err) ||
        !GetU64IfPresent(j, "StageTimeoutSec", cfg.stage_timeout_sec, err) ||
        !GetStringIfPresent(j, "PlainCaption", cfg.plain_caption, err) ||
        !GetStringIfPresent(j, "ProgressFile", cfg.progress_file, err) ||
        !GetStringIfPresent(j, "Outbox", cfg.outbox, err)) {
        return false;
    }

    {
        std::string policy;
        if (!GetStringIfPresent(j, "ZeroBytePolicy", policy, err))
            return false;
        if (policy == "reject") {
            cfg.reject_zero_byte = true;
        } else if (policy == "upload") {
            cfg.reject_zero_byte = false;
        } else if (!policy.empty()) {
            err = "ZeroBytePolicy must be \"upload\" or \"reject\", got \"" + policy + "\"";
            return false;
        }
    }
    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (!level.empty()) {
            auto parsed = ParseLogLevel(level);
            if (!parsed) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = *parsed;
        }
    }

    const nlohmann::json* telegram = nullptr;
    if (!GetObjectIfPresent(j, "Telegram", telegram, err))
        return false;
    if (telegram) {
        if (!GetStringIfPresent(*telegram, "BotToken", cfg.telegram.bot_token, err) ||
            !GetStringIfPresent(*telegram, "ApiHost", cfg.telegram.api_host, err)) {
            return false;
        }
        // Chat ids are often written as numbers.
        auto it = telegram->find("ChatId");
        if (it != telegram->end() && it->is_number_integer()) {
            cfg.telegram.chat_id = std::to_string(it->get<long long>());
        } else if (!GetStringIfPresent(*telegram, "ChatId", cfg.telegram.chat_id, err)) {
            return false;
        }
    }

    const nlohmann::json* mega = nullptr;
    if (!GetObjectIfPresent(j, "Mega", mega, err))
        return false;
    if (mega && !GetStringIfPresent(*mega, "ApiHost", cfg.mega.api_host, err))
        return false;

    return true;
}

} // namespace relay::config::detail
