#include "swap/archive_handle.hpp"

namespace hotswap {

namespace {
constexpr size_t kReadBlockSize = 64 * 1024;
} // namespace

int OpenArchiveFile(const std::string& path, ArchiveReadPtr& out) {
    out.reset(archive_read_new());
    if (!out) return ARCHIVE_FATAL;

    archive_read_support_filter_all(out.get());
    archive_read_support_format_all(out.get());
    return archive_read_open_filename(out.get(), path.c_str(), kReadBlockSize);
}

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace hotswap
