#include "relay/archive_expander.hpp"

#include "crypto/sha256.hpp"
#include "io/file_writer.hpp"
#include "relay/archive_path_policy.hpp"
#include "relay/archive_reader.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <filesystem>
#include <memory>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace relay {

namespace {

constexpr const char kScratchSuffix[] = ".partial";

// Sibling directory holding members while they are written; member names
// cannot reach it.
class ScratchDir {
  public:
    explicit ScratchDir(std::string path) : path_(std::move(path)) {}
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) LogWarn("cannot remove %s: %s", path_.c_str(), ec.message().c_str());
    }

    Result Create() const {
        std::error_code ec;
        if (!fs::create_directory(path_, ec)) {
            const int e = ec ? ec.value() : EEXIST;
            return Result::FromErrno(e, "cannot create " + path_ + ": " + std::generic_category().message(e));
        }
        return Result::Ok();
    }

    std::string PathFor(const std::string& name) const { return (fs::path(path_) / name).string(); }

  private:
    std::string path_;
};

// Files this expansion created; removed again unless committed.
class CreatedFiles {
  public:
    CreatedFiles() = default;
    CreatedFiles(const CreatedFiles&) = delete;
    CreatedFiles& operator=(const CreatedFiles&) = delete;

    ~CreatedFiles() {
        if (committed_) return;
        for (const auto& p : paths_) {
            std::error_code ec;
            fs::remove(p, ec);
            if (ec) LogWarn("cannot remove %s: %s", p.c_str(), ec.message().c_str());
        }
    }

    void Add(std::string p) { paths_.push_back(std::move(p)); }
    void Commit() { committed_ = true; }

  private:
    std::vector<std::string> paths_;
    bool committed_ = false;
};

Result CopyEntry(IReader& entry, FileWriter& writer) {
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, "expansion cancelled");
        const ssize_t n = entry.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return Result::Fail(ErrorKind::ArchiveCorrupt, "archive member data is corrupt");
        if (n == 0) break;
        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;
    }
    return writer.Finish();
}

} // namespace

std::string ArchiveExpander::DisambiguatedName(const std::string& name,
                                               const std::string& archive_name) {
    const auto [stem, ext] = SplitExtension(name);
    return stem + "~" + Sha256Hex(archive_name).substr(0, 8) + ext;
}

Result ArchiveExpander::Expand(const std::string& archive_path,
                               const std::string& dest_dir,
                               std::vector<ExpandedMember>& out) const {
    out.clear();

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Result::FromErrno(ec.value(), "cannot create " + dest_dir + ": " + ec.message());
    }

    ZipArchiveReader reader;
    auto open_result = reader.Open(archive_path);
    if (!open_result.is_ok()) return open_result;

    fs::path dest = fs::path(dest_dir).lexically_normal();
    if (!dest.has_filename()) dest = dest.parent_path();
    ScratchDir scratch(dest.string() + kScratchSuffix);
    auto scratch_result = scratch.Create();
    if (!scratch_result.is_ok()) return scratch_result;

    CreatedFiles created;
    std::unordered_set<std::string> taken;
    std::vector<ExpandedMember> members;

    while (true) {
        ArchiveEntryInfo entry{};
        bool eof = false;
        auto next_result = reader.Next(entry, eof);
        if (!next_result.is_ok()) return next_result;
        if (eof) break;

        std::string rel;
        auto path_result = ArchivePathPolicy::NormalizeEntryPath(entry.name, rel);
        if (!path_result.is_ok()) return path_result;

        std::string name(LastSegment(rel));
        if (name.empty() || name == "." || name == "..") {
            LogDebug("skip archive entry: %s", entry.name.c_str());
            continue;
        }

        if (taken.count(name) != 0) {
            const std::string alt = DisambiguatedName(name, rel);
            if (taken.count(alt) != 0) {
                return Result::Fail(ErrorKind::ArchiveCollision,
                                    "archive member name collision: " + rel + " (" + alt + ")");
            }
            LogInfo("Member %s renamed to %s", rel.c_str(), alt.c_str());
            name = alt;
        }
        taken.insert(name);

        const std::string final_path = (fs::path(dest_dir) / name).string();
        const std::string partial_path = scratch.PathFor(name);

        std::unique_ptr<IReader> entry_reader;
        auto er = reader.OpenCurrentEntryReader(entry_reader);
        if (!er.is_ok()) return er;

        FileWriter writer;
        auto wo = FileWriter::Open(partial_path, FileWriter::Mode::CreateExclusive, writer);
        if (!wo.is_ok()) {
            if (wo.err == EEXIST) {
                return Result::Fail(ErrorKind::ArchiveCollision, wo.msg, wo.err);
            }
            return wo;
        }
        created.Add(partial_path);

        auto copy_result = CopyEntry(*entry_reader, writer);
        if (!copy_result.is_ok()) return copy_result.Wrap("member " + rel);

        if (fs::exists(final_path, ec)) {
            return Result::Fail(ErrorKind::ArchiveCollision,
                                "archive member would overwrite " + final_path);
        }
        fs::rename(partial_path, final_path, ec);
        if (ec) {
            return Result::FromErrno(ec.value(), "rename " + partial_path + ": " + ec.message());
        }
        created.Add(final_path);

        LogDebug("expanded %s -> %s (%llu bytes)",
                 rel.c_str(),
                 final_path.c_str(),
                 (unsigned long long)writer.BytesWritten());
        members.push_back(ExpandedMember{
            .path = final_path,
            .name = name,
            .archive_name = rel,
            .size = writer.BytesWritten(),
        });
    }

    // Every member is on disk; only now may the archive go.
    fs::remove(archive_path, ec);
    if (ec) {
        return Result::FromErrno(ec.value(), "cannot remove archive " + archive_path + ": " + ec.message());
    }

    created.Commit();
    out = std::move(members);
    LogInfo("Expanded %zu member(s) from %s", out.size(), archive_path.c_str());
    return Result::Ok();
}

} // namespace relay
