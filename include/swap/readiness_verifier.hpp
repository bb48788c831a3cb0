#pragma once

#include "host/capability_registry.hpp"
#include "host/module_registry.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace hotswap {

struct ReadinessReport {
    bool ready = false;
    std::string detail;
    std::size_t ui_surfaces = 0;
    std::size_t commands = 0;
};

// Pure read over live host state; safe to call any number of times.
class ReadinessVerifier {
  public:
    struct Options {
        std::string ui_prefix;
        std::string command_prefix;
        std::size_t min_ui_surfaces = 6;
        std::size_t min_commands = 10;
        std::string settings_probe_field = "version";
    };

    ReadinessVerifier(const ModuleRegistry& modules,
                      const CapabilityRegistry& capabilities,
                      Options opt)
        : modules_(modules), capabilities_(capabilities), opt_(std::move(opt)) {}

    ReadinessReport CheckReady(const std::string& ns) const;

  private:
    const ModuleRegistry& modules_;
    const CapabilityRegistry& capabilities_;
    Options opt_;
};

} // namespace hotswap
