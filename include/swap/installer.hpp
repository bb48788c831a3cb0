#pragma once

#include "swap/filesystem_ops.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace hotswap {

// The single mutation point for the code the host will execute next.
class Installer {
  public:
    Installer();
    explicit Installer(std::shared_ptr<const IFilesystemOps> fs_ops);

    // Deletes `install_dir` when present, then moves `staging_root` into its place.
    Result Replace(const std::string& staging_root, const std::string& install_dir) const;

  private:
    std::shared_ptr<const IFilesystemOps> fs_ops_;
};

} // namespace hotswap
