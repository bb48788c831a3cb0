#include "util/config_json_utils.hpp"

#include <fstream>

namespace hotswap::config::detail {

namespace {

// Returns false only when the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string("'") + key + "' must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "namespace", cfg.extension_namespace, err) ||
        !GetStringIfPresent(j, "install_dir", cfg.install_dir, err) ||
        !GetStringIfPresent(j, "entry_point", cfg.entry_point, err) ||
        !GetStringIfPresent(j, "ui_prefix", cfg.ui_prefix, err) ||
        !GetStringIfPresent(j, "command_prefix", cfg.command_prefix, err) ||
        !GetStringIfPresent(j, "settings_probe_field", cfg.settings_probe_field, err)) {
        return false;
    }

    if (!GetU64IfPresent(j, "min_ui_surfaces", cfg.min_ui_surfaces, err) ||
        !GetU64IfPresent(j, "min_commands", cfg.min_commands, err) ||
        !GetU64IfPresent(j, "verify_delay_ms", cfg.verify_delay_ms, err) ||
        !GetU64IfPresent(j, "reconfigure_delay_ms", cfg.reconfigure_delay_ms, err)) {
        return false;
    }

    {
        std::string level;
        if (!GetStringIfPresent(j, "log_level", level, err))
            return false;
        if (!level.empty()) {
            LogLevel parsed{};
            if (!ParseLogLevel(level, parsed)) {
                err = "unknown log_level: " + level;
                return false;
            }
            cfg.log_level = parsed;
        }
    }

    if (cfg.extension_namespace.empty()) {
        err = "namespace must not be empty";
        return false;
    }
    if (cfg.entry_point.empty() || cfg.entry_point.find('/') != std::string::npos) {
        err = "entry_point must be a plain file name";
        return false;
    }

    return true;
}

} // namespace hotswap::config::detail
