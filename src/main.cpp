#include "relay/directory_relay.hpp"
#include "relay/mega_client.hpp"
#include "relay/progress_sinks.hpp"
#include "relay/relay_pipeline.hpp"
#include "relay/telegram_relay.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "megarelay.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] [message ...]\n"
        "\n"
        "Each message is searched for a MEGA file link; without messages, one\n"
        "message per line is read from stdin.\n"
        "\n"
        "Options:\n"
        "  -c, --config       JSON config file (default ./megarelay.json if present)\n"
        "  -s, --staging      Staging root directory (default downloads)\n"
        "  -C, --chunk-size   Largest upload in bytes (default 2147483648)\n"
        "  -o, --outbox       Deliver into this directory instead of Telegram\n"
        "  -t, --timeout      Per-stage network deadline in seconds, 0 = none\n"
        "  -v, --verbose      Debug logging\n"
        "  -h, --help         Show this help\n",
        argv);
}

bool ParseU64(const char *s, std::uint64_t &out) {
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || end == s || *end != '\0' || s[0] == '-')
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

std::unique_ptr<relay::IProgress> MakeSink(const relay::config::RelayConfig &cfg) {
    if (!cfg.progress_file.empty())
        return std::make_unique<relay::FileProgressSink>(cfg.progress_file);
    if (::isatty(STDERR_FILENO))
        return std::make_unique<relay::ConsoleProgressSink>();
    return std::make_unique<relay::LogProgressSink>();
}

std::unique_ptr<relay::IRelay> MakeRelay(const relay::config::RelayConfig &cfg) {
    if (!cfg.outbox.empty())
        return std::make_unique<relay::DirectoryRelay>(cfg.outbox);
    return std::make_unique<relay::TelegramRelay>(relay::TelegramRelay::Options{
        .bot_token = cfg.telegram.bot_token,
        .chat_id = cfg.telegram.chat_id,
        .api_host = cfg.telegram.api_host,
        .timeout = std::chrono::seconds(cfg.stage_timeout_sec),
    });
}

} // namespace

int main(int argc, char **argv) {
    relay::InstallSignalHandlers();

    const char *config_cli = nullptr;
    const char *staging_cli = nullptr;
    const char *outbox_cli = nullptr;
    std::optional<std::uint64_t> chunk_cli;
    std::optional<std::uint64_t> timeout_cli;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"staging", required_argument, nullptr, 's'},
        {"chunk-size", required_argument, nullptr, 'C'},
        {"outbox", required_argument, nullptr, 'o'},
        {"timeout", required_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:s:C:o:t:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'v':
                verbose = true;
                break;

            case 'c':
                config_cli = optarg;
                break;

            case 's':
                staging_cli = optarg;
                break;

            case 'o':
                outbox_cli = optarg;
                break;

            case 'C':
            case 't': {
                std::uint64_t v{};
                if (!ParseU64(optarg, v)) {
                    std::fprintf(stderr, "Invalid --%s: %s\n", c == 'C' ? "chunk-size" : "timeout", optarg);
                    return 2;
                }
                (c == 'C' ? chunk_cli : timeout_cli) = v;
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    relay::config::RelayConfig cfg;
    std::error_code ec;
    if (config_cli || std::filesystem::exists(kDefaultConfigPath, ec)) {
        const std::string path = config_cli ? config_cli : kDefaultConfigPath;
        if (auto r = relay::config::RelayConfig::LoadFile(path, cfg); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 2;
        }
    }
    if (staging_cli)
        cfg.staging_root = staging_cli;
    if (outbox_cli)
        cfg.outbox = outbox_cli;
    if (chunk_cli)
        cfg.chunk_size_limit = *chunk_cli;
    if (timeout_cli)
        cfg.stage_timeout_sec = *timeout_cli;
    if (verbose)
        cfg.log_level = relay::LogLevel::Debug;

    if (auto r = cfg.Validate(); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }
    relay::Logger::Instance().SetLevel(cfg.log_level);

    relay::MegaClient storage(relay::MegaClient::Options{
        .api_host = cfg.mega.api_host,
        .timeout = std::chrono::seconds(cfg.stage_timeout_sec),
    });
    auto destination = MakeRelay(cfg);
    auto sink = MakeSink(cfg);

    relay::RelayPipeline pipeline(storage, *destination, sink.get(), relay::RelayPipeline::Options{
        .staging_root = cfg.staging_root,
        .chunk_size_limit = cfg.chunk_size_limit,
        .poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms),
        .stage_timeout = std::chrono::seconds(cfg.stage_timeout_sec),
        .zero_byte_policy = cfg.reject_zero_byte ? relay::ZeroBytePolicy::Reject
                                                 : relay::ZeroBytePolicy::UploadEmpty,
        .plain_caption = cfg.plain_caption,
    });

    int failures = 0;
    auto handle = [&](const std::string &message) {
        relay::JobReport report;
        auto r = pipeline.Run(message, report);
        if (r.ok) {
            std::printf("Task completed in %.2f seconds.\n", report.elapsed_seconds);
        } else {
            ++failures;
            std::printf("An error occurred while processing your link: %s\n", report.message.c_str());
        }
        std::fflush(stdout);
    };

    if (optind < argc) {
        for (int i = optind; i < argc && !relay::CancelRequested(); ++i)
            handle(argv[i]);
    } else {
        std::string line;
        while (!relay::CancelRequested() && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;
            handle(line);
        }
    }

    return failures == 0 ? 0 : 1;
}
