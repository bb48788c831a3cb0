#include "swap/installer.hpp"

#include "util/logger.hpp"

#include <cerrno>

namespace hotswap {

Installer::Installer() : fs_ops_(DefaultFilesystemOps()) {}

Installer::Installer(std::shared_ptr<const IFilesystemOps> fs_ops)
    : fs_ops_(fs_ops ? std::move(fs_ops) : DefaultFilesystemOps()) {}

Result Installer::Replace(const std::string& staging_root, const std::string& install_dir) const {
    if (!fs_ops_->Exists(staging_root))
        return Result::Fail(ENOENT, "staged extension missing: " + staging_root);

    if (fs_ops_->Exists(install_dir)) {
        LogDebug("removing %s", install_dir.c_str());
        auto rm = fs_ops_->RemoveTree(install_dir);
        if (!rm.is_ok())
            return Result::Fail(rm.err, "cannot remove old installation: " + rm.msg);
    }

    auto mv = fs_ops_->Move(staging_root, install_dir);
    if (!mv.is_ok())
        return Result::Fail(mv.err, "cannot move new installation into place: " + mv.msg);
    return Result::Ok();
}

} // namespace hotswap
