#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <vector>

namespace hotswap {

// Contents of an installed extension's entry-point file.
struct ExtensionManifest {
    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> ui_surfaces;
    std::vector<std::string> commands;
    nlohmann::json settings = nlohmann::json::object();
};

class ExtensionManifestParser {
  public:
    std::expected<ExtensionManifest, std::string> Parse(const std::string& json_input) const;
    std::expected<ExtensionManifest, std::string> ParseFile(const std::string& path) const;
};

} // namespace hotswap
