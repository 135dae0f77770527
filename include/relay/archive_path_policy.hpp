#pragma once

#include "util/result.hpp"

#include <string>

namespace relay {

class ArchivePathPolicy {
  public:
    // Normalized relative entry path; "" for entries that name nothing
    // (e.g. "./"). Absolute or ".."-escaping paths fail with ArchiveCorrupt.
    static Result NormalizeEntryPath(const std::string& raw_path, std::string& out_relative);

  private:
    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace relay
