#pragma once

#include "relay/chunk_splitter.hpp"
#include "relay/progress.hpp"
#include "relay/relay.hpp"
#include "relay/source_link.hpp"
#include "relay/staging_area.hpp"
#include "relay/storage_client.hpp"
#include "relay/transfer_job.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

class Uploader;

// What to do with a fetched object of zero bytes.
enum class ZeroBytePolicy {
    UploadEmpty,
    Reject,
};

struct JobReport {
    std::string job_id; // empty when the message never became a job
    std::string source_uri;
    JobState final_state = JobState::Pending;
    std::vector<JobState> history;
    ErrorKind failure_kind = ErrorKind::None;
    std::string failure_stage;
    std::string message; // "<stage> failed [<kind>]: <cause>" on failure
    std::uint64_t items_delivered = 0;
    std::uint64_t total_bytes = 0;
    double elapsed_seconds = 0.0;

    bool Succeeded() const { return final_state == JobState::Completed; }
};

// Runs one link through fetch, classification, expansion or splitting and
// upload, strictly in sequence, inside a private staging directory that is
// removed on every exit path. The first failure ends the job.
class RelayPipeline {
  public:
    struct Options {
        std::string staging_root = "downloads";
        std::uint64_t chunk_size_limit = kDefaultChunkSizeLimit;
        std::chrono::milliseconds poll_interval{1000};
        std::chrono::seconds stage_timeout{0};
        ZeroBytePolicy zero_byte_policy = ZeroBytePolicy::UploadEmpty;
        std::string plain_caption = "❤️ Created by @NT_BOT_CHANNEL";
        std::string member_caption_prefix = "Extracted file: ";
        std::shared_ptr<const StagingArea::ISystemOps> staging_ops; // null: local filesystem
    };

    RelayPipeline(IStorageClient& storage, IRelay& relay, IProgress* sink, Options opt);

    // `message_text` may carry other words around the link. Fills `out`
    // whatever happens and returns the job failure, if any.
    Result Run(std::string_view message_text, JobReport& out);

  private:
    Result Execute(TransferJob& job,
                   const SourceLink& link,
                   const StagingArea& staging,
                   Uploader& uploader,
                   std::string& stage);
    Result UploadArchive(TransferJob& job,
                         const std::string& archive_path,
                         const StagingArea& staging,
                         Uploader& uploader,
                         std::string& stage);
    Result UploadInParts(TransferJob& job,
                         const std::string& path,
                         Uploader& uploader,
                         std::string& stage);

    IStorageClient& storage_;
    IRelay& relay_;
    IProgress* sink_ = nullptr;
    Options opt_;
};

} // namespace relay
