#pragma once

#include "util/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace hotswap::config {

// Settings for one extension managed by the updater. Every field has a usable
// default so a missing config file only means "use defaults".
struct UpdaterConfig {
    std::string extension_namespace = "extension";
    std::string install_dir;
    std::string entry_point = "extension.json";

    std::string ui_prefix;       // empty => "<namespace>_PT_"
    std::string command_prefix;  // empty => "<namespace>_OT_"
    std::uint64_t min_ui_surfaces = 6;
    std::uint64_t min_commands = 10;
    std::string settings_probe_field = "version";

    std::uint64_t verify_delay_ms = 1000;
    std::uint64_t reconfigure_delay_ms = 1500;

    std::optional<LogLevel> log_level;

    void Reset();
    bool LoadFile(const std::string& path);

    std::string EffectiveUiPrefix() const;
    std::string EffectiveCommandPrefix() const;
};

} // namespace hotswap::config
