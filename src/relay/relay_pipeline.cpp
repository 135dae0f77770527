#include "relay/relay_pipeline.hpp"

#include "relay/archive_expander.hpp"
#include "relay/content_classifier.hpp"
#include "relay/fetcher.hpp"
#include "relay/uploader.hpp"
#include "util/logger.hpp"

namespace relay {

namespace {

// The fetched object lives one level down so its remote name can never
// clash with the expansion directory.
constexpr const char kFetchDir[] = "fetch";
constexpr const char kExtractedDir[] = "extracted";

std::string FailureMessage(std::string_view stage, const Result& r) {
    return std::string(stage) + " failed [" + std::string(ToString(r.kind)) + "]: " + r.msg;
}

} // namespace

RelayPipeline::RelayPipeline(IStorageClient& storage, IRelay& relay, IProgress* sink, Options opt)
    : storage_(storage), relay_(relay), sink_(sink), opt_(std::move(opt)) {}

Result RelayPipeline::Run(std::string_view message_text, JobReport& out) {
    const auto started = std::chrono::steady_clock::now();
    out = JobReport{};

    auto finish_rejected = [&](Result r) {
        out.final_state = JobState::Failed;
        out.failure_kind = r.kind;
        out.failure_stage = "Link";
        out.message = FailureMessage(out.failure_stage, r);
        out.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        LogError("%s", out.message.c_str());
        return r;
    };

    // Link shape and kind are checked before anything touches the disk.
    const auto link = FindSourceLink(message_text);
    if (!link) {
        return finish_rejected(Result::Fail(ErrorKind::LinkInvalid, "no valid link found in message"));
    }
    out.source_uri = link->ToString();
    if (link->kind == SourceKind::Folder) {
        return finish_rejected(Result::Fail(ErrorKind::UnsupportedSource, "folder links are not supported"));
    }

    TransferJob job;
    job.id = NewJobId();
    job.source_uri = out.source_uri;
    LogInfo("Job %s: %s", job.id.c_str(), job.source_uri.c_str());

    Uploader uploader(relay_, sink_, {.poll_interval = opt_.poll_interval});
    std::string stage = "Staging";
    Result result = Result::Ok();
    {
        StagingArea staging(opt_.staging_ops);
        result = StagingArea::Acquire(opt_.staging_root, job.id, staging);
        if (result.is_ok()) {
            job.staging_dir = staging.Dir();
            result = Execute(job, *link, staging, uploader, stage);

            auto released = staging.Release();
            if (!released.is_ok()) {
                LogError("Job %s: %s", job.id.c_str(), released.msg.c_str());
                if (result.is_ok()) {
                    result = released;
                    stage = "Cleanup";
                }
            }
        }
    }

    if (result.is_ok()) {
        result = job.Transition(JobState::Completed);
    }
    if (!result.is_ok()) {
        job.error = result;
        if (!IsTerminal(job.state)) {
            auto t = job.Transition(JobState::Failed);
            if (!t.is_ok()) LogError("%s", t.msg.c_str());
        }
        out.failure_kind = result.kind;
        out.failure_stage = stage;
        out.message = FailureMessage(stage, result);
        LogError("Job %s: %s", job.id.c_str(), out.message.c_str());
    }

    out.job_id = job.id;
    out.final_state = job.state;
    out.history = job.history;
    out.items_delivered = uploader.ItemsDelivered();
    out.total_bytes = uploader.BytesDelivered();
    out.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (out.Succeeded()) {
        LogInfo("Job %s completed in %.2f seconds", job.id.c_str(), out.elapsed_seconds);
    }
    return result;
}

Result RelayPipeline::Execute(TransferJob& job,
                              const SourceLink& link,
                              const StagingArea& staging,
                              Uploader& uploader,
                              std::string& stage) {
    stage = "Fetch";
    auto r = job.Transition(JobState::Fetching);
    if (!r.is_ok()) return r;

    Fetcher fetcher(storage_, sink_, {.poll_interval = opt_.poll_interval, .timeout = opt_.stage_timeout});
    FetchedObject fetched;
    r = fetcher.Fetch(link, staging.PathFor(kFetchDir), fetched);
    if (!r.is_ok()) return r;
    job.total_bytes = fetched.size;

    stage = "Classify";
    r = job.Transition(JobState::Classifying);
    if (!r.is_ok()) return r;

    if (fetched.size == 0) {
        if (opt_.zero_byte_policy == ZeroBytePolicy::Reject) {
            return Result::Fail(ErrorKind::DownloadFailure, fetched.name + " is empty");
        }
        LogWarn("%s is empty; uploading a zero-length file", fetched.name.c_str());
    } else {
        ContentKind kind = ContentKind::PlainFile;
        r = ContentClassifier::Classify(fetched.path, kind);
        if (!r.is_ok()) return r;
        LogInfo("%s classified as %s", fetched.name.c_str(), std::string(ToString(kind)).c_str());

        if (kind == ContentKind::Archive) {
            return UploadArchive(job, fetched.path, staging, uploader, stage);
        }
        if (fetched.size > opt_.chunk_size_limit) {
            return UploadInParts(job, fetched.path, uploader, stage);
        }
    }

    stage = "Upload";
    r = job.Transition(JobState::Uploading);
    if (!r.is_ok()) return r;
    return uploader.Upload(fetched.path, opt_.plain_caption);
}

Result RelayPipeline::UploadArchive(TransferJob& job,
                                    const std::string& archive_path,
                                    const StagingArea& staging,
                                    Uploader& uploader,
                                    std::string& stage) {
    stage = "Expand";
    auto r = job.Transition(JobState::Expanding);
    if (!r.is_ok()) return r;

    std::vector<ExpandedMember> members;
    r = ArchiveExpander{}.Expand(archive_path, staging.PathFor(kExtractedDir), members);
    if (!r.is_ok()) return r;

    stage = "Upload";
    r = job.Transition(JobState::Uploading);
    if (!r.is_ok()) return r;

    for (const auto& m : members) {
        r = uploader.Upload(m.path, opt_.member_caption_prefix + m.name);
        if (!r.is_ok()) return r.Wrap("member " + m.name);
    }
    return Result::Ok();
}

Result RelayPipeline::UploadInParts(TransferJob& job,
                                    const std::string& path,
                                    Uploader& uploader,
                                    std::string& stage) {
    stage = "Split";
    auto r = job.Transition(JobState::Splitting);
    if (!r.is_ok()) return r;

    ChunkSplitter splitter;
    r = ChunkSplitter::Open(path, opt_.chunk_size_limit, splitter);
    if (!r.is_ok()) return r;
    LogInfo("Splitting %s into %llu part(s)", path.c_str(), (unsigned long long)splitter.Count());

    // One part on disk at a time: write, upload, delete, next.
    for (std::uint64_t i = 0; i < splitter.Count(); ++i) {
        const ChunkDescriptor part = splitter.Describe(i);

        stage = "Split";
        r = splitter.Materialize(part);
        if (!r.is_ok()) return r;

        if (i == 0) {
            r = job.Transition(JobState::Uploading);
            if (!r.is_ok()) return r;
        }

        stage = "Upload";
        r = uploader.Upload(part.path, part.Caption());
        if (!r.is_ok()) {
            return r.Wrap("part " + std::to_string(part.ordinal) + "/" + std::to_string(part.total));
        }
    }
    return Result::Ok();
}

} // namespace relay
