#include "relay/transfer_job.hpp"

#include "util/logger.hpp"

#include <unistd.h>

#include <atomic>

namespace relay {

std::string_view ToString(JobState s) {
    switch (s) {
    case JobState::Pending: return "Pending";
    case JobState::Fetching: return "Fetching";
    case JobState::Classifying: return "Classifying";
    case JobState::Expanding: return "Expanding";
    case JobState::Splitting: return "Splitting";
    case JobState::Uploading: return "Uploading";
    case JobState::Completed: return "Completed";
    case JobState::Failed: return "Failed";
    }
    return "Unknown";
}

bool IsTerminal(JobState s) { return s == JobState::Completed || s == JobState::Failed; }

bool IsAllowedTransition(JobState from, JobState to) {
    if (IsTerminal(from)) return false;
    if (to == JobState::Failed) return true;
    switch (from) {
    case JobState::Pending: return to == JobState::Fetching;
    case JobState::Fetching: return to == JobState::Classifying;
    case JobState::Classifying:
        return to == JobState::Expanding || to == JobState::Splitting || to == JobState::Uploading;
    case JobState::Expanding:
    case JobState::Splitting: return to == JobState::Uploading;
    case JobState::Uploading: return to == JobState::Completed;
    default: return false;
    }
}

Result TransferJob::Transition(JobState to) {
    if (!IsAllowedTransition(state, to)) {
        return Result::Fail(ErrorKind::Io,
                            "job " + id + ": illegal transition " + std::string(ToString(state)) + " -> " +
                                std::string(ToString(to)));
    }
    LogInfo("Job %s: %s -> %s",
            id.c_str(),
            std::string(ToString(state)).c_str(),
            std::string(ToString(to)).c_str());
    state = to;
    history.push_back(to);
    return Result::Ok();
}

std::string NewJobId() {
    static std::atomic<std::uint64_t> seq{0};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    return std::to_string(ms) + "-" + std::to_string(::getpid()) + "-" + std::to_string(seq.fetch_add(1));
}

} // namespace relay
