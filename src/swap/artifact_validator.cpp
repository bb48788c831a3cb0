#include "swap/artifact_validator.hpp"

#include "swap/archive_handle.hpp"
#include "swap/archive_path_policy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace hotswap {

namespace {

constexpr size_t kMaxEntryPointBytes = 1024 * 1024;

std::string ReadManifestVersion(const std::string& content) {
    const auto j = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object()) return {};
    auto it = j.find("version");
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace

Result ArtifactValidator::Validate(const std::string& path, ArtifactInfo& out) const {
    out = ArtifactInfo{};

    std::error_code ec;
    const auto st = fs::status(fs::path(path), ec);
    if (ec || !fs::exists(st)) {
        return Result::Fail(ENOENT, "artifact not found: " + path);
    }
    if (!fs::is_regular_file(st)) {
        return Result::Fail(EINVAL, "artifact is not a regular file: " + path);
    }

    ArchiveReadPtr ar;
    if (OpenArchiveFile(path, ar) != ARCHIVE_OK) {
        return Result::Fail(EINVAL, "not a valid archive: " + ArchiveErr(ar.get()));
    }

    const ArchivePathPolicy path_policy(true);
    std::string entry_point_content;
    bool entry_point_found = false;
    std::string root;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        // Warnings are treated as corruption: this gate never guesses.
        if (r != ARCHIVE_OK) {
            return Result::Fail(EINVAL, "corrupt archive (header): " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return Result::Fail(EINVAL, path_res.msg);

        const auto type = archive_entry_filetype(entry);
        bool is_entry_point = false;
        if (!rel.empty() && rel != ".") {
            ++out.entry_count;

            const std::string seg(FirstSegment(rel));
            if (root.empty()) {
                root = seg;
            } else if (seg != root) {
                return Result::Fail(EINVAL,
                                    "archive has more than one root folder ('" + root + "', '" +
                                        seg + "')");
            }
            if (rel == root && type != AE_IFDIR) {
                return Result::Fail(EINVAL, "archive root entry is not a folder: " + rel);
            }
            is_entry_point = (type == AE_IFREG && rel == root + "/" + entry_point_);
            entry_point_found = entry_point_found || is_entry_point;
        }

        // Pull every data block so per-entry checksums are verified.
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Result::Fail(EINVAL,
                                    "corrupt archive (data of " + rel + "): " + ArchiveErr(ar.get()));
            }
            if (is_entry_point && entry_point_content.size() + size <= kMaxEntryPointBytes) {
                entry_point_content.append(static_cast<const char*>(buff), size);
            }
        }
    }

    if (out.entry_count == 0) {
        return Result::Fail(EINVAL, "archive is empty: " + path);
    }
    if (!entry_point_found) {
        return Result::Fail(EINVAL,
                            "archive root folder '" + root + "' has no " + entry_point_);
    }

    out.root_folder = root;
    out.version = ReadManifestVersion(entry_point_content);
    LogDebug("artifact ok: root=%s entries=%llu version=%s",
             out.root_folder.c_str(),
             (unsigned long long)out.entry_count,
             out.version.empty() ? "?" : out.version.c_str());
    return Result::Ok();
}

} // namespace hotswap
