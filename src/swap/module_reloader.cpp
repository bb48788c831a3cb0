#include "swap/module_reloader.hpp"

#include "util/logger.hpp"

#include <exception>

namespace hotswap {

const char* ToString(ReloadStatus s) {
    switch (s) {
        case ReloadStatus::Reloaded: return "reloaded";
        case ReloadStatus::Evicted:  return "evicted";
        case ReloadStatus::Missing:  return "missing";
    }
    return "unknown";
}

std::size_t ReloadReport::Evicted() const {
    std::size_t n = 0;
    for (const auto& [name, outcome] : outcomes) {
        if (outcome.status == ReloadStatus::Evicted) ++n;
    }
    return n;
}

ReloadReport ModuleReloader::Reload(std::string_view prefix) {
    ReloadReport report;

    const auto names = registry_.ListByPrefix(prefix);
    report.discovered = names.size();
    LogDebug("reload: %zu units under '%.*s'", names.size(), (int)prefix.size(), prefix.data());

    for (const auto& name : names) {
        ILoadedModule* unit = registry_.Find(name);
        if (!unit) {
            report.outcomes[name] = ReloadOutcome{.status = ReloadStatus::Missing, .error = {}};
            continue;
        }

        Result res;
        try {
            res = unit->Reload();
        } catch (const std::exception& e) {
            res = Result::Fail(-1, std::string("exception: ") + e.what());
        } catch (...) {
            res = Result::Fail(-1, "unknown exception");
        }

        if (!res.is_ok()) {
            Evict(name, res.msg, report);
            continue;
        }

        report.outcomes[name] = ReloadOutcome{};
        ++report.reloaded;
        LogDebug("reloaded %s", name.c_str());
    }

    return report;
}

void ModuleReloader::Evict(const std::string& name, std::string error, ReloadReport& report) {
    LogWarn("reload of %s failed, evicting: %s", name.c_str(), error.c_str());
    (void)registry_.Evict(name);
    report.outcomes[name] = ReloadOutcome{.status = ReloadStatus::Evicted, .error = std::move(error)};
}

} // namespace hotswap
