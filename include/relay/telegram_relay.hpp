#pragma once

#include "net/http_client.hpp"
#include "relay/relay.hpp"

#include <chrono>
#include <string>

namespace relay {

// Bot API sendDocument. The document is streamed from disk.
class TelegramRelay final : public IRelay {
  public:
    struct Options {
        std::string bot_token;
        std::string chat_id;
        std::string api_host = "api.telegram.org";
        std::chrono::seconds timeout{0};
    };

    explicit TelegramRelay(Options opt);

    Result Send(const std::string& path,
                const std::string& caption,
                std::atomic<std::uint64_t>* bytes_sent) override;

    // Maps a sendDocument reply to a result: {"ok":true,...} or
    // {"ok":false,"description":"..."}.
    static Result ParseReply(unsigned http_status, const std::string& body);

  private:
    Options opt_;
    net::HttpClient http_;
};

} // namespace relay
