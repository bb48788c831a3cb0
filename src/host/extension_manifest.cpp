#include "host/extension_manifest.hpp"

#include <fstream>
#include <sstream>

namespace hotswap {

using json = nlohmann::json;

namespace {

std::expected<std::vector<std::string>, std::string> ParseIdArray(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end()) return out;
    if (!it->is_array()) {
        return std::unexpected(std::string("'") + key + "' must be an array");
    }

    out.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            return std::unexpected(std::string("'") + key + "' entries must be non-empty strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::expected<ExtensionManifest, std::string>
ExtensionManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        ExtensionManifest m;
        m.name = j.value("name", "");
        m.version = j.value("version", "0.0.0");
        m.description = j.value("description", "");
        if (m.name.empty()) {
            return std::unexpected("manifest missing 'name'");
        }

        auto ui = ParseIdArray(j, "ui_surfaces");
        if (!ui) return std::unexpected(ui.error());
        m.ui_surfaces = std::move(*ui);

        auto commands = ParseIdArray(j, "commands");
        if (!commands) return std::unexpected(commands.error());
        m.commands = std::move(*commands);

        if (j.contains("settings")) {
            if (!j["settings"].is_object()) {
                return std::unexpected("'settings' must be an object");
            }
            m.settings = j["settings"];
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<ExtensionManifest, std::string>
ExtensionManifestParser::ParseFile(const std::string& path) const {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return Parse(ss.str());
}

} // namespace hotswap
