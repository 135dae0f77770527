#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace relay {

struct ExpandedMember {
    std::string path;          // file inside the destination directory
    std::string name;          // display name (file name on disk)
    std::string archive_name;  // normalized archive-relative path
    std::uint64_t size = 0;
};

// Expands every regular file of a ZIP archive into one flat directory.
//
// Two members that share a file name are not allowed to overwrite each
// other: the later one becomes "<stem>~<hash><ext>", where <hash> is the
// first 8 hex digits of SHA-256 over its archive-relative path. A name that
// is still taken fails with ArchiveCollision.
//
// On any failure every member written so far is removed and the archive is
// left in place. On success the archive file itself is deleted.
class ArchiveExpander {
  public:
    Result Expand(const std::string& archive_path,
                  const std::string& dest_dir,
                  std::vector<ExpandedMember>& out) const;

    static std::string DisambiguatedName(const std::string& name, const std::string& archive_name);
};

} // namespace relay
