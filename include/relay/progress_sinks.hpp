#pragma once

#include "relay/progress.hpp"

#include <string>

namespace relay {

// Atomically replaced JSON status file, for external dashboards.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    Result OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

// Single rewriting line on stderr.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    Result OnProgress(const ProgressEvent& e) override;
};

class LogProgressSink final : public IProgress {
public:
    LogProgressSink() = default;

    Result OnProgress(const ProgressEvent& e) override;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace relay
