#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hotswap {

struct ExtensionMetadata {
    std::string name;
    std::string version;
    std::string description;
};

// What an extension has registered with the host: UI surfaces, commands,
// its metadata object and its per-session settings document.
class CapabilityRegistry {
  public:
    Result RegisterUiSurface(std::string id);
    Result RegisterCommand(std::string id);
    // Removes a UI surface or command. False when neither knows `id`.
    bool Unregister(std::string_view id);

    std::vector<std::string> ListUiSurfaces(std::string_view prefix) const;
    std::vector<std::string> ListCommands(std::string_view prefix) const;

    void SetMetadata(const std::string& ns, ExtensionMetadata meta);
    const ExtensionMetadata* FindMetadata(std::string_view ns) const;
    void RemoveMetadata(std::string_view ns);

    void AttachSettings(const std::string& ns, nlohmann::json settings);
    const nlohmann::json* FindSettings(std::string_view ns) const;
    nlohmann::json* FindSettings(std::string_view ns);
    void DetachSettings(std::string_view ns);

  private:
    using IdSet = std::set<std::string, std::less<>>;

    static std::vector<std::string> ListPrefix(const IdSet& ids, std::string_view prefix);

    IdSet ui_surfaces_;
    IdSet commands_;
    std::map<std::string, ExtensionMetadata, std::less<>> metadata_;
    std::map<std::string, nlohmann::json, std::less<>> settings_;
};

} // namespace hotswap
