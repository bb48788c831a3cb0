#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace hotswap {

struct ArtifactInfo {
    std::string root_folder;
    std::uint64_t entry_count = 0;
    // From the entry-point manifest when it carries one, empty otherwise.
    std::string version;
};

// Structural gate run before any filesystem mutation. Never writes to disk.
class ArtifactValidator {
  public:
    explicit ArtifactValidator(std::string entry_point) : entry_point_(std::move(entry_point)) {}

    /**
     * @brief Checks, in order: the file exists, it is a readable archive whose
     *        entries all decode cleanly, it is non-empty, every entry sits under
     *        one root folder, and that folder holds the entry-point file.
     * @param path Local archive path supplied by the collaborator.
     * @param out  Filled on success.
     */
    Result Validate(const std::string& path, ArtifactInfo& out) const;

  private:
    std::string entry_point_;
};

} // namespace hotswap
