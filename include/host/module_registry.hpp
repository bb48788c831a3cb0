#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hotswap {

// A code unit the host currently has loaded.
class ILoadedModule {
  public:
    virtual ~ILoadedModule() = default;

    // Re-executes the unit from its current on-disk source.
    virtual Result Reload() = 0;
    // Lets the unit rebind host state once deferred startup has settled.
    virtual Result Configure() { return Result::Ok(); }
};

// Live table of loaded units keyed by dotted identity ("ns", "ns.sub.unit").
// Being listed here is what "loaded" means, independent of what is on disk.
class ModuleRegistry {
  public:
    ModuleRegistry() = default;
    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    Result Insert(std::string name, std::unique_ptr<ILoadedModule> unit);
    // Drops the unit so the next reference loads it fresh. False when absent.
    bool Evict(std::string_view name);

    bool Contains(std::string_view name) const;
    ILoadedModule* Find(std::string_view name) const;
    // Lexicographically sorted.
    std::vector<std::string> ListByPrefix(std::string_view prefix) const;
    std::size_t Size() const { return units_.size(); }

  private:
    std::map<std::string, std::unique_ptr<ILoadedModule>, std::less<>> units_;
};

} // namespace hotswap
