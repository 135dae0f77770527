#include "relay/staging_area.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace relay {

namespace {

class PosixSystemOps final : public StagingArea::ISystemOps {
  public:
    Result CreateRoot(std::string_view root) const override {
        std::error_code ec;
        fs::create_directories(fs::path(root), ec);
        if (ec) {
            return Result::FromErrno(ec.value(),
                                     "cannot create staging root " + std::string(root) + ": " +
                                         ec.message());
        }
        return Result::Ok();
    }

    Result CreateJobDirectory(std::string_view dir) const override {
        if (::mkdir(std::string(dir).c_str(), 0700) != 0) {
            const int e = errno;
            return Result::FromErrno(
                e, "mkdir " + std::string(dir) + " failed: " + std::strerror(e));
        }
        return Result::Ok();
    }

    Result RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io,
                                "cannot remove " + std::string(dir) + ": " + ec.message(),
                                ec.value());
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const StagingArea::ISystemOps> StagingArea::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

StagingArea::StagingArea() : system_ops_(DefaultSystemOps()) {}

StagingArea::StagingArea(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

StagingArea::StagingArea(StagingArea&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)) {
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

StagingArea& StagingArea::operator=(StagingArea&& other) noexcept {
    if (this == &other)
        return *this;
    (void)Release();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

StagingArea::~StagingArea() {
    auto res = Release();
    if (!res.is_ok()) {
        LogError("Staging cleanup failed: %s", res.msg.c_str());
    }
}

Result StagingArea::Acquire(std::string_view root, std::string_view job_id, StagingArea& out) {
    auto released = out.Release();
    if (!released.is_ok())
        return released;

    if (job_id.empty() || job_id.find('/') != std::string_view::npos || job_id == "." ||
        job_id == "..") {
        return Result::Fail(ErrorKind::Io, "invalid job id for staging: " + std::string(job_id));
    }

    const std::string root_dir = root.empty() ? std::string("downloads") : std::string(root);
    auto root_result = out.system_ops_->CreateRoot(root_dir);
    if (!root_result.is_ok())
        return root_result;

    const std::string dir = (fs::path(root_dir) / std::string(job_id)).string();
    auto create_result = out.system_ops_->CreateJobDirectory(dir);
    if (!create_result.is_ok())
        return create_result;

    out.dir_ = dir;
    LogDebug("Staging acquired: %s", out.dir_.c_str());
    return Result::Ok();
}

Result StagingArea::Release() {
    if (dir_.empty())
        return Result::Ok();

    auto remove_result = system_ops_->RemoveTree(dir_);
    if (!remove_result.is_ok())
        return remove_result;

    LogDebug("Staging released: %s", dir_.c_str());
    dir_.clear();
    return Result::Ok();
}

std::string StagingArea::PathFor(std::string_view name) const {
    return (fs::path(dir_) / std::string(name)).string();
}

} // namespace relay
