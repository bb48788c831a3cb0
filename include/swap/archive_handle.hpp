#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>

namespace hotswap {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;
using ArchiveWritePtr = std::unique_ptr<archive, ArchiveWriteDeleter>;

// Reader with every filter and format libarchive knows, opened on `path`.
// Returns the libarchive status of the open call.
int OpenArchiveFile(const std::string& path, ArchiveReadPtr& out);

std::string ArchiveErr(archive* ar);

} // namespace hotswap
