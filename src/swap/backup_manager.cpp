#include "swap/backup_manager.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace hotswap {

BackupManager::BackupManager() : BackupManager(DefaultFilesystemOps()) {}

BackupManager::BackupManager(std::shared_ptr<const IFilesystemOps> fs_ops, Clock clock)
    : fs_ops_(fs_ops ? std::move(fs_ops) : DefaultFilesystemOps()),
      clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

std::string BackupManager::BackupPathFor(const std::string& install_dir) const {
    const fs::path src = fs::path(install_dir).lexically_normal();
    const fs::path dir = src.has_filename() ? src : src.parent_path();

    const std::time_t now = clock_();
    std::tm tm{};
    char ts[32] = "00000000_000000";
    if (localtime_r(&now, &tm) != nullptr) {
        std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", &tm);
    }
    return (dir.parent_path() / (dir.filename().string() + "_backup_" + ts)).string();
}

Result BackupManager::Backup(const std::string& install_dir, BackupSnapshot& out) const {
    out = BackupSnapshot{};

    const std::string backup_path = BackupPathFor(install_dir);
    if (fs_ops_->Exists(backup_path)) {
        LogInfo("Replacing stale backup %s", backup_path.c_str());
        auto rm = fs_ops_->RemoveTree(backup_path);
        if (!rm.is_ok())
            return Result::Fail(rm.err, "cannot remove stale backup: " + rm.msg);
    }

    std::string source_digest;
    auto dr = DigestTree(install_dir, source_digest);
    if (!dr.is_ok())
        return Result::Fail(dr.err, "cannot digest installation: " + dr.msg);

    auto cr = fs_ops_->CopyTree(install_dir, backup_path);
    if (!cr.is_ok()) {
        // A partial copy is never a usable backup.
        DiscardPartial(backup_path);
        return Result::Fail(cr.err, "backup copy failed: " + cr.msg);
    }

    std::string copy_digest;
    dr = DigestTree(backup_path, copy_digest);
    if (!dr.is_ok() || copy_digest != source_digest) {
        DiscardPartial(backup_path);
        return Result::Fail(dr.is_ok() ? EIO : dr.err,
                            dr.is_ok() ? "backup copy does not match installation"
                                       : "cannot digest backup: " + dr.msg);
    }

    out.path = backup_path;
    out.tree_sha256 = source_digest;
    return Result::Ok();
}

void BackupManager::DiscardPartial(const std::string& backup_path) const {
    auto rm = fs_ops_->RemoveTree(backup_path);
    if (!rm.is_ok()) {
        LogWarn("Could not remove incomplete backup %s: %s", backup_path.c_str(), rm.msg.c_str());
    }
}

Result BackupManager::Restore(const BackupSnapshot& snapshot, const std::string& install_dir) const {
    if (snapshot.Empty())
        return Result::Fail(EINVAL, "no backup to restore");
    if (!fs_ops_->Exists(snapshot.path))
        return Result::Fail(ENOENT, "backup missing: " + snapshot.path);

    if (fs_ops_->Exists(install_dir)) {
        auto rm = fs_ops_->RemoveTree(install_dir);
        if (!rm.is_ok())
            return Result::Fail(rm.err, "cannot clear installation: " + rm.msg);
    }

    auto cr = fs_ops_->CopyTree(snapshot.path, install_dir);
    if (!cr.is_ok())
        return Result::Fail(cr.err, "restore copy failed: " + cr.msg);

    if (!snapshot.tree_sha256.empty()) {
        std::string restored;
        auto dr = DigestTree(install_dir, restored);
        if (!dr.is_ok())
            return Result::Fail(dr.err, "cannot digest restored installation: " + dr.msg);
        if (restored != snapshot.tree_sha256)
            return Result::Fail(EIO, "restored installation does not match backup");
    }
    return Result::Ok();
}

Result BackupManager::Discard(const BackupSnapshot& snapshot) const {
    if (snapshot.Empty())
        return Result::Ok();
    return fs_ops_->RemoveTree(snapshot.path);
}

} // namespace hotswap
