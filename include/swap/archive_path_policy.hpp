#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace hotswap {

class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    // Empty or "." results mean "archive root", callers skip those entries.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(std::string_view p);

  private:
    Result Normalize(const char* raw_path, const char* what, std::string& out_relative) const;

    bool safe_paths_only_ = true;
};

} // namespace hotswap
