#include "host/capability_registry.hpp"

#include "util/path_utils.hpp"

#include <cerrno>

namespace hotswap {

Result CapabilityRegistry::RegisterUiSurface(std::string id) {
    if (id.empty())
        return Result::Fail(EINVAL, "UI surface id must not be empty");
    if (!ui_surfaces_.insert(std::move(id)).second)
        return Result::Fail(EEXIST, "UI surface already registered");
    return Result::Ok();
}

Result CapabilityRegistry::RegisterCommand(std::string id) {
    if (id.empty())
        return Result::Fail(EINVAL, "command id must not be empty");
    if (!commands_.insert(std::move(id)).second)
        return Result::Fail(EEXIST, "command already registered");
    return Result::Ok();
}

bool CapabilityRegistry::Unregister(std::string_view id) {
    bool removed = false;
    if (auto it = ui_surfaces_.find(id); it != ui_surfaces_.end()) {
        ui_surfaces_.erase(it);
        removed = true;
    }
    if (auto it = commands_.find(id); it != commands_.end()) {
        commands_.erase(it);
        removed = true;
    }
    return removed;
}

std::vector<std::string> CapabilityRegistry::ListUiSurfaces(std::string_view prefix) const {
    return ListPrefix(ui_surfaces_, prefix);
}

std::vector<std::string> CapabilityRegistry::ListCommands(std::string_view prefix) const {
    return ListPrefix(commands_, prefix);
}

void CapabilityRegistry::SetMetadata(const std::string& ns, ExtensionMetadata meta) {
    metadata_.insert_or_assign(ns, std::move(meta));
}

const ExtensionMetadata* CapabilityRegistry::FindMetadata(std::string_view ns) const {
    auto it = metadata_.find(ns);
    return it == metadata_.end() ? nullptr : &it->second;
}

void CapabilityRegistry::RemoveMetadata(std::string_view ns) {
    if (auto it = metadata_.find(ns); it != metadata_.end())
        metadata_.erase(it);
}

void CapabilityRegistry::AttachSettings(const std::string& ns, nlohmann::json settings) {
    settings_.insert_or_assign(ns, std::move(settings));
}

const nlohmann::json* CapabilityRegistry::FindSettings(std::string_view ns) const {
    auto it = settings_.find(ns);
    return it == settings_.end() ? nullptr : &it->second;
}

nlohmann::json* CapabilityRegistry::FindSettings(std::string_view ns) {
    auto it = settings_.find(ns);
    return it == settings_.end() ? nullptr : &it->second;
}

void CapabilityRegistry::DetachSettings(std::string_view ns) {
    if (auto it = settings_.find(ns); it != settings_.end())
        settings_.erase(it);
}

std::vector<std::string> CapabilityRegistry::ListPrefix(const IdSet& ids, std::string_view prefix) {
    std::vector<std::string> out;
    for (auto it = ids.lower_bound(prefix); it != ids.end() && StartsWith(*it, prefix); ++it) {
        out.push_back(*it);
    }
    return out;
}

} // namespace hotswap
