#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace hotswap {

// Every destructive filesystem call made during an update goes through this
// seam so the transaction can be exercised against injected failures.
class IFilesystemOps {
  public:
    virtual ~IFilesystemOps() = default;

    virtual bool Exists(std::string_view path) const = 0;
    virtual Result CreateDirectories(std::string_view path) const = 0;
    // `dst` must not exist; it is created with the full contents of `src`.
    virtual Result CopyTree(std::string_view src, std::string_view dst) const = 0;
    // Succeeds when `path` is already absent.
    virtual Result RemoveTree(std::string_view path) const = 0;
    virtual Result Move(std::string_view src, std::string_view dst) const = 0;
};

std::shared_ptr<const IFilesystemOps> DefaultFilesystemOps();

// Deterministic SHA-256 over relative paths, entry types, file contents and
// symlink targets of a directory tree.
Result DigestTree(const std::string& root, std::string& out_hex);

} // namespace hotswap
