#include "swap/archive_path_policy.hpp"

#include "util/path_utils.hpp"

namespace hotswap {

bool ArchivePathPolicy::IsSafeRelativePath(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string_view::npos) return false;

    while (!p.empty()) {
        const auto pos = p.find('/');
        if (p.substr(0, pos) == "..") return false;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos + 1);
    }
    return true;
}

Result ArchivePathPolicy::Normalize(const char* raw_path,
                                    const char* what,
                                    std::string& out_relative) const {
    out_relative = NormalizeArchivePath(raw_path ? std::string(raw_path) : std::string());
    if (out_relative.empty() || out_relative == ".") return Result::Ok();

    if (safe_paths_only_ && !IsSafeRelativePath(out_relative)) {
        return Result::Fail(-1, std::string("Unsafe ") + what + " in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    return Normalize(raw_path, "path", out_relative);
}

Result ArchivePathPolicy::NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const {
    if (!raw_path || !*raw_path) {
        out_relative.clear();
        return Result::Ok();
    }
    return Normalize(raw_path, "hardlink target", out_relative);
}

} // namespace hotswap
