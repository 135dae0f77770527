#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace relay::config {

struct TelegramConfig {
    std::string bot_token;
    std::string chat_id;
    std::string api_host = "api.telegram.org";
};

struct MegaConfig {
    std::string api_host = "g.api.mega.co.nz";
};

struct RelayConfig {
    std::string staging_root = "downloads";
    std::uint64_t chunk_size_limit = 2ULL * 1024 * 1024 * 1024;
    std::uint64_t poll_interval_ms = 1000;
    std::uint64_t stage_timeout_sec = 0;
    bool reject_zero_byte = false;
    std::string plain_caption = "❤️ Created by @NT_BOT_CHANNEL";
    LogLevel log_level = LogLevel::Info;
    std::string progress_file;
    std::string outbox;
    TelegramConfig telegram;
    MegaConfig mega;

    // Keys absent from the file keep their defaults. Fails with Config.
    static Result LoadFile(const std::string& path, RelayConfig& out);

    // Range checks shared by the file loader and command-line overrides.
    Result Validate() const;
};

} // namespace relay::config
