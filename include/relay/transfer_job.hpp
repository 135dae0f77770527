#pragma once

#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

enum class JobState {
    Pending,
    Fetching,
    Classifying,
    Expanding,
    Splitting,
    Uploading,
    Completed,
    Failed,
};

std::string_view ToString(JobState s);

bool IsTerminal(JobState s);

// Whether the lifecycle permits `from -> to`.
bool IsAllowedTransition(JobState from, JobState to);

struct TransferJob {
    std::string id;
    std::string source_uri;
    std::string staging_dir;
    JobState state = JobState::Pending;
    std::optional<std::uint64_t> total_bytes;
    std::chrono::system_clock::time_point created = std::chrono::system_clock::now();
    std::optional<Result> error;
    std::vector<JobState> history{JobState::Pending};

    // Fails (Io) when the lifecycle forbids the move; state is unchanged then.
    Result Transition(JobState to);
};

// "<unix millis>-<pid>-<sequence>"; unique within and across processes on
// one host.
std::string NewJobId();

} // namespace relay
