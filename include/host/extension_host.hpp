#pragma once

#include "host/capability_registry.hpp"
#include "host/extension_manifest.hpp"
#include "host/module_registry.hpp"

#include <string>
#include <vector>

namespace hotswap {

// Root unit of an extension, named after its namespace. Reloading re-reads the
// entry-point manifest, re-registers what it declares, and loads shared
// objects that appeared under the installation since the last load.
class ManifestModule final : public ILoadedModule {
  public:
    ManifestModule(std::string ns,
                   std::string install_dir,
                   std::string entry_point,
                   ModuleRegistry& modules,
                   CapabilityRegistry& capabilities);
    ~ManifestModule() override;

    Result Reload() override;
    Result Configure() override;

  private:
    void RegisterCapabilities(const ExtensionManifest& manifest);
    void UnregisterCapabilities();
    void AttachSettings(const ExtensionManifest& manifest);
    void LoadNewUnits();

    std::string ns_;
    std::string install_dir_;
    std::string entry_point_;
    ModuleRegistry& modules_;
    CapabilityRegistry& capabilities_;

    std::vector<std::string> registered_;
    nlohmann::json default_settings_ = nlohmann::json::object();
};

// Stand-alone host used by the command line tool: owns the live registries and
// loads an installed extension into them.
class ExtensionHost {
  public:
    ExtensionHost(std::string ns, std::string install_dir, std::string entry_point);
    ExtensionHost(const ExtensionHost&) = delete;
    ExtensionHost& operator=(const ExtensionHost&) = delete;

    Result LoadInstalled();

    ModuleRegistry& Modules() { return modules_; }
    CapabilityRegistry& Capabilities() { return capabilities_; }

  private:
    std::string ns_;
    std::string install_dir_;
    std::string entry_point_;

    // Declared first so units are torn down before the capabilities they touch.
    CapabilityRegistry capabilities_;
    ModuleRegistry modules_;
};

// "<ns>.<relative path without extension>" with '/' mapped to '.'.
std::string UnitNameFor(const std::string& ns, const std::string& relative_path);

} // namespace hotswap
