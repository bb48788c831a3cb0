#pragma once

#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace hotswap {

class ArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        // Polled between entries; extraction stops with ECANCELED when set.
        const std::atomic_bool* cancel = nullptr;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    // Extracts every entry of `archive_path` below the existing `dst_dir`.
    Result ExtractToDir(const std::string& archive_path,
                        const std::string& dst_dir,
                        std::uint64_t* out_bytes = nullptr) const;

  private:
    Options opt_{};
};

} // namespace hotswap
