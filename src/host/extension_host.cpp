#include "host/extension_host.hpp"

#include "host/shared_object_module.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace hotswap {

std::string UnitNameFor(const std::string& ns, const std::string& relative_path) {
    std::string stem = fs::path(relative_path).replace_extension().generic_string();
    std::replace(stem.begin(), stem.end(), '/', '.');
    return ns + "." + stem;
}

ManifestModule::ManifestModule(std::string ns,
                               std::string install_dir,
                               std::string entry_point,
                               ModuleRegistry& modules,
                               CapabilityRegistry& capabilities)
    : ns_(std::move(ns)),
      install_dir_(std::move(install_dir)),
      entry_point_(std::move(entry_point)),
      modules_(modules),
      capabilities_(capabilities) {}

ManifestModule::~ManifestModule() {
    UnregisterCapabilities();
}

Result ManifestModule::Reload() {
    const std::string path = (fs::path(install_dir_) / entry_point_).string();
    auto parsed = ExtensionManifestParser{}.ParseFile(path);
    if (!parsed)
        return Result::Fail(EINVAL, path + ": " + parsed.error());

    RegisterCapabilities(*parsed);
    capabilities_.SetMetadata(ns_,
                              ExtensionMetadata{
                                  .name = parsed->name,
                                  .version = parsed->version,
                                  .description = parsed->description,
                              });
    AttachSettings(*parsed);
    LoadNewUnits();

    LogDebug("%s: %s %s (%zu capabilities)",
             ns_.c_str(), parsed->name.c_str(), parsed->version.c_str(), registered_.size());
    return Result::Ok();
}

Result ManifestModule::Configure() {
    const ExtensionMetadata* meta = capabilities_.FindMetadata(ns_);
    if (!meta)
        return Result::Fail(ENOENT, "metadata missing for " + ns_);

    // The session may have been reset while the swap was running.
    if (!capabilities_.FindSettings(ns_)) {
        nlohmann::json settings = default_settings_;
        settings["version"] = meta->version;
        capabilities_.AttachSettings(ns_, std::move(settings));
    }
    LogInfo("%s configured at version %s", ns_.c_str(), meta->version.c_str());
    return Result::Ok();
}

void ManifestModule::RegisterCapabilities(const ExtensionManifest& manifest) {
    UnregisterCapabilities();

    auto add = [this](const std::string& id, Result res) {
        if (res.is_ok()) {
            registered_.push_back(id);
        } else {
            LogWarn("%s: cannot register %s: %s", ns_.c_str(), id.c_str(), res.msg.c_str());
        }
    };
    for (const auto& id : manifest.ui_surfaces) add(id, capabilities_.RegisterUiSurface(id));
    for (const auto& id : manifest.commands) add(id, capabilities_.RegisterCommand(id));
}

void ManifestModule::UnregisterCapabilities() {
    for (const auto& id : registered_) {
        (void)capabilities_.Unregister(id);
    }
    registered_.clear();
}

void ManifestModule::AttachSettings(const ExtensionManifest& manifest) {
    default_settings_ = manifest.settings;

    nlohmann::json* live = capabilities_.FindSettings(ns_);
    if (live && live->is_object()) {
        // Keep the session's values, only add fields the new version introduced.
        for (const auto& [key, value] : manifest.settings.items()) {
            if (!live->contains(key)) (*live)[key] = value;
        }
        (*live)["version"] = manifest.version;
        return;
    }

    nlohmann::json settings = manifest.settings;
    settings["version"] = manifest.version;
    capabilities_.AttachSettings(ns_, std::move(settings));
}

void ManifestModule::LoadNewUnits() {
    std::error_code ec;
    std::vector<std::string> rel_paths;
    for (fs::recursive_directory_iterator it(install_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".so") {
            rel_paths.push_back(fs::relative(it->path(), install_dir_, ec).generic_string());
        }
    }
    if (ec) {
        LogWarn("%s: scan of %s incomplete: %s", ns_.c_str(), install_dir_.c_str(), ec.message().c_str());
    }
    std::sort(rel_paths.begin(), rel_paths.end());

    for (const auto& rel : rel_paths) {
        const std::string name = UnitNameFor(ns_, rel);
        if (modules_.Contains(name)) continue;

        std::unique_ptr<SharedObjectModule> unit;
        auto lr = SharedObjectModule::Load((fs::path(install_dir_) / rel).string(), unit);
        if (!lr.is_ok()) {
            LogWarn("%s: skipping %s: %s", ns_.c_str(), rel.c_str(), lr.msg.c_str());
            continue;
        }
        auto ir = modules_.Insert(name, std::move(unit));
        if (!ir.is_ok()) {
            LogWarn("%s: %s", ns_.c_str(), ir.msg.c_str());
        }
    }
}

ExtensionHost::ExtensionHost(std::string ns, std::string install_dir, std::string entry_point)
    : ns_(std::move(ns)), install_dir_(std::move(install_dir)), entry_point_(std::move(entry_point)) {}

Result ExtensionHost::LoadInstalled() {
    if (modules_.Contains(ns_))
        return Result::Ok();

    std::error_code ec;
    if (!fs::is_directory(install_dir_, ec) || ec)
        return Result::Fail(ENOENT, ns_ + " is not installed at " + install_dir_);

    auto root = std::make_unique<ManifestModule>(ns_, install_dir_, entry_point_, modules_, capabilities_);
    auto res = root->Reload();
    if (!res.is_ok())
        return res;
    return modules_.Insert(ns_, std::move(root));
}

} // namespace hotswap
