#include "swap/filesystem_ops.hpp"

#include "crypto/sha256.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace hotswap {

namespace {

Result FromErrorCode(const std::error_code& ec, const std::string& what) {
    return Result::Fail(ec.value(), what + ": " + ec.message());
}

class StdFilesystemOps final : public IFilesystemOps {
  public:
    bool Exists(std::string_view path) const override {
        std::error_code ec;
        return fs::symlink_status(fs::path(path), ec).type() != fs::file_type::not_found && !ec;
    }

    Result CreateDirectories(std::string_view path) const override {
        std::error_code ec;
        fs::create_directories(fs::path(path), ec);
        if (ec)
            return FromErrorCode(ec, "create_directories " + std::string(path));
        return Result::Ok();
    }

    Result CopyTree(std::string_view src, std::string_view dst) const override {
        std::error_code ec;
        if (!fs::is_directory(fs::path(src), ec) || ec)
            return Result::Fail(ENOTDIR, "copy source is not a directory: " + std::string(src));
        if (Exists(dst))
            return Result::Fail(EEXIST, "copy destination already exists: " + std::string(dst));

        fs::copy(fs::path(src),
                 fs::path(dst),
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks,
                 ec);
        if (ec)
            return FromErrorCode(ec, "copy " + std::string(src) + " -> " + std::string(dst));
        return Result::Ok();
    }

    Result RemoveTree(std::string_view path) const override {
        std::error_code ec;
        fs::remove_all(fs::path(path), ec);
        if (ec)
            return FromErrorCode(ec, "remove " + std::string(path));
        return Result::Ok();
    }

    Result Move(std::string_view src, std::string_view dst) const override {
        std::error_code ec;
        fs::rename(fs::path(src), fs::path(dst), ec);
        if (!ec)
            return Result::Ok();
        if (ec != std::errc::cross_device_link)
            return FromErrorCode(ec, "rename " + std::string(src) + " -> " + std::string(dst));

        // Staging on another filesystem: fall back to copy then remove.
        auto copy_res = CopyTree(src, dst);
        if (!copy_res.is_ok())
            return copy_res;
        return RemoveTree(src);
    }
};

} // namespace

std::shared_ptr<const IFilesystemOps> DefaultFilesystemOps() {
    static const std::shared_ptr<const IFilesystemOps> kDefault =
        std::make_shared<StdFilesystemOps>();
    return kDefault;
}

Result DigestTree(const std::string& root, std::string& out_hex) {
    std::error_code ec;
    if (!fs::is_directory(fs::path(root), ec) || ec)
        return Result::Fail(ENOTDIR, "not a directory: " + root);

    std::vector<fs::path> entries;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec)
        return FromErrorCode(ec, "walk " + root);
    std::sort(entries.begin(), entries.end());

    Sha256Hasher hasher;
    for (const auto& p : entries) {
        const std::string rel = fs::relative(p, root, ec).generic_string();
        if (ec)
            return FromErrorCode(ec, "relative " + p.string());

        const auto st = fs::symlink_status(p, ec);
        if (ec)
            return FromErrorCode(ec, "stat " + p.string());

        if (fs::is_symlink(st)) {
            const auto target = fs::read_symlink(p, ec);
            if (ec)
                return FromErrorCode(ec, "readlink " + p.string());
            hasher.Update("L:" + rel + "->" + target.string() + "\n");
        } else if (fs::is_directory(st)) {
            hasher.Update("D:" + rel + "\n");
        } else if (fs::is_regular_file(st)) {
            hasher.Update("F:" + rel + ":" + std::to_string(fs::file_size(p, ec)) + "\n");
            if (ec)
                return FromErrorCode(ec, "size " + p.string());
            auto hr = HashFileInto(p.string(), hasher);
            if (!hr.is_ok())
                return hr;
        } else {
            hasher.Update("O:" + rel + "\n");
        }
    }

    out_hex = hasher.FinalHex();
    if (out_hex.empty())
        return Result::Fail(-1, "sha256 failed for tree " + root);
    return Result::Ok();
}

} // namespace hotswap
