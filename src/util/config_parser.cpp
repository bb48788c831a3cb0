#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace hotswap::config {

void UpdaterConfig::Reset() {
    *this = UpdaterConfig{};
}

bool UpdaterConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogWarn("Config: %s", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s in %s", err.c_str(), path.c_str());
        Reset();
        return false;
    }

    return true;
}

std::string UpdaterConfig::EffectiveUiPrefix() const {
    return ui_prefix.empty() ? extension_namespace + "_PT_" : ui_prefix;
}

std::string UpdaterConfig::EffectiveCommandPrefix() const {
    return command_prefix.empty() ? extension_namespace + "_OT_" : command_prefix;
}

} // namespace hotswap::config
