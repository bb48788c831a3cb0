#pragma once

#include "host/module_registry.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace hotswap {

enum class ReloadStatus {
    Reloaded,
    Evicted,   // reload failed, unit dropped from the registry
    Missing,   // disappeared while earlier units were reloading
};

const char* ToString(ReloadStatus s);

struct ReloadOutcome {
    ReloadStatus status = ReloadStatus::Reloaded;
    std::string error;
};

struct ReloadReport {
    std::map<std::string, ReloadOutcome> outcomes;
    std::size_t discovered = 0;
    std::size_t reloaded = 0;

    std::size_t Evicted() const;
};

class IModuleReloader {
  public:
    virtual ~IModuleReloader() = default;
    virtual ReloadReport Reload(std::string_view prefix) = 0;
};

class ModuleReloader final : public IModuleReloader {
  public:
    explicit ModuleReloader(ModuleRegistry& registry) : registry_(registry) {}

    // Reloads every live unit whose name starts with `prefix`, in
    // lexicographic order. Failures are recorded per unit; nothing propagates.
    ReloadReport Reload(std::string_view prefix) override;

  private:
    void Evict(const std::string& name, std::string error, ReloadReport& report);

    ModuleRegistry& registry_;
};

} // namespace hotswap
