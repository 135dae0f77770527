#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace relay {

// Per-job scratch directory under a shared staging root. The directory is
// created empty and exclusively for one job, and removed recursively when the
// session is released or destroyed.
class StagingArea {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        // Idempotent; an existing root is fine.
        virtual Result CreateRoot(std::string_view root) const = 0;
        // Exclusive; an existing directory is an error.
        virtual Result CreateJobDirectory(std::string_view dir) const = 0;
        // Recursive; a missing directory is not an error.
        virtual Result RemoveTree(std::string_view dir) const = 0;
    };

    StagingArea();
    explicit StagingArea(std::shared_ptr<const ISystemOps> system_ops);
    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    StagingArea(StagingArea&& other) noexcept;
    StagingArea& operator=(StagingArea&& other) noexcept;
    ~StagingArea();

    static Result Acquire(std::string_view root, std::string_view job_id, StagingArea& out);

    Result Release();

    bool Held() const { return !dir_.empty(); }
    const std::string& Dir() const { return dir_; }
    std::string PathFor(std::string_view name) const;

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
};

} // namespace relay
