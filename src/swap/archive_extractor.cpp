#include "swap/archive_extractor.hpp"

#include "swap/archive_handle.hpp"
#include "swap/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>

namespace hotswap {

Result ArchiveExtractor::ExtractToDir(const std::string& archive_path,
                                      const std::string& dst_dir,
                                      std::uint64_t* out_bytes) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::exists(base_dir, ec) || ec) {
        return Result::Fail(ENOENT, "Destination directory does not exist: " + dst_dir);
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ENOTDIR, "Destination path is not a directory: " + dst_dir);
    }

    ArchiveReadPtr ar;
    if (OpenArchiveFile(archive_path, ar) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_read_open_filename: " + ArchiveErr(ar.get()));
    }

    ArchiveWritePtr aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject all valid extraction targets.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    const ArchivePathPolicy path_policy(opt_.safe_paths_only);
    std::uint64_t extracted = 0;
    archive_entry* entry = nullptr;

    while (true) {
        if (opt_.cancel && opt_.cancel->load(std::memory_order_relaxed)) {
            return Result::Fail(ECANCELED, "extraction cancelled");
        }

        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Result::Fail(-1, "archive_read_data_block: " + ArchiveErr(ar.get()));

            const int ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return Result::Fail(-1, "archive_write_data_block: " + ArchiveErr(aw.get()));

            extracted += static_cast<std::uint64_t>(size);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return Result::Fail(-1, "archive_write_finish_entry: " + ArchiveErr(aw.get()));
    }

    if (out_bytes) *out_bytes = extracted;
    return Result::Ok();
}

} // namespace hotswap
