#pragma once

#include "swap/filesystem_ops.hpp"
#include "util/result.hpp"

#include <ctime>
#include <functional>
#include <memory>
#include <string>

namespace hotswap {

struct BackupSnapshot {
    std::string path;
    std::string tree_sha256;

    bool Empty() const { return path.empty(); }
};

class BackupManager {
  public:
    using Clock = std::function<std::time_t()>;

    BackupManager();
    explicit BackupManager(std::shared_ptr<const IFilesystemOps> fs_ops, Clock clock = {});

    // Sibling of `install_dir` named "<name>_backup_<YYYYmmdd_HHMMSS>".
    std::string BackupPathFor(const std::string& install_dir) const;

    /**
     * @brief Copies the whole installation to a timestamped sibling and proves
     *        the copy by comparing tree digests. A leftover backup with the same
     *        name (retry within one second) is replaced.
     */
    Result Backup(const std::string& install_dir, BackupSnapshot& out) const;

    // Replaces `install_dir` with the snapshot contents and checks the digest.
    Result Restore(const BackupSnapshot& snapshot, const std::string& install_dir) const;

    Result Discard(const BackupSnapshot& snapshot) const;

  private:
    void DiscardPartial(const std::string& backup_path) const;

    std::shared_ptr<const IFilesystemOps> fs_ops_;
    Clock clock_;
};

} // namespace hotswap
