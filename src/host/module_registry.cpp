#include "host/module_registry.hpp"

#include "util/path_utils.hpp"

#include <cerrno>

namespace hotswap {

Result ModuleRegistry::Insert(std::string name, std::unique_ptr<ILoadedModule> unit) {
    if (name.empty())
        return Result::Fail(EINVAL, "module name must not be empty");
    if (!unit)
        return Result::Fail(EINVAL, "module '" + name + "' is null");
    if (units_.contains(name))
        return Result::Fail(EEXIST, "module already loaded: " + name);
    units_.emplace(std::move(name), std::move(unit));
    return Result::Ok();
}

bool ModuleRegistry::Evict(std::string_view name) {
    auto it = units_.find(name);
    if (it == units_.end())
        return false;
    units_.erase(it);
    return true;
}

bool ModuleRegistry::Contains(std::string_view name) const {
    return units_.find(name) != units_.end();
}

ILoadedModule* ModuleRegistry::Find(std::string_view name) const {
    auto it = units_.find(name);
    return it == units_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ModuleRegistry::ListByPrefix(std::string_view prefix) const {
    std::vector<std::string> out;
    for (auto it = units_.lower_bound(prefix); it != units_.end(); ++it) {
        if (!StartsWith(it->first, prefix))
            break;
        out.push_back(it->first);
    }
    return out;
}

} // namespace hotswap
