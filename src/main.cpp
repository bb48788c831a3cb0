#include "host/extension_host.hpp"
#include "host/scheduler.hpp"
#include "swap/readiness_verifier.hpp"
#include "swap/update_orchestrator.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <string>
#include <string_view>

namespace {

constexpr const char* kDefaultConfigPath = "/etc/hotswap/hotswap.conf";

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitRolledBack = 3;

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -i <archive> [-e <version>] [-d <install-dir>] [-n <namespace>] [-c <config>] [-v]\n"
        "   %s --reload [-d <install-dir>] [-n <namespace>] [-c <config>]\n"
        "   %s --check  [-d <install-dir>] [-n <namespace>] [-c <config>]\n"
        "\n"
        "Options:\n"
        "  -i, --input        Archive holding the new extension version\n"
        "  -e, --expect-version  Version the archive should contain (warns on mismatch)\n"
        "  -d, --install-dir  Directory of the installed extension\n"
        "  -n, --namespace    Namespace prefix of the extension's units\n"
        "  -c, --config       Config file (default %s, or $HOTSWAP_CONFIG_PATH)\n"
        "  -r, --reload       Reload the installed extension without an archive\n"
        "  -k, --check        Print the readiness report and exit\n"
        "  -v, --verbose      Debug logging\n"
        "  -h, --help         Show this help\n",
        argv, argv, argv, kDefaultConfigPath);
}

class ConsoleNotifier final : public hotswap::INotifier {
  public:
    void Notify(bool success, std::string_view summary) override {
        std::fprintf(stdout, "[hotswap] %s: %.*s\n",
                     success ? "OK" : "FAILED", (int)summary.size(), summary.data());
        std::fflush(stdout);
    }
};

int ExitCodeFor(const hotswap::UpdateOutcome& outcome) {
    switch (outcome.state) {
        case hotswap::UpdateState::Succeeded:  return kExitOk;
        case hotswap::UpdateState::RolledBack: return kExitRolledBack;
        default:                               return kExitFailed;
    }
}

} // namespace

int main(int argc, char** argv) {
    hotswap::InstallSignalHandlers();

    const char* input = nullptr;
    const char* expected_version = nullptr;
    const char* install_cli = nullptr;
    const char* ns_cli = nullptr;
    const char* config_cli = nullptr;
    bool reload_only = false;
    bool check_only = false;
    bool verbose = false;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"expect-version", required_argument, nullptr, 'e'},
        {"install-dir", required_argument, nullptr, 'd'},
        {"namespace", required_argument, nullptr, 'n'},
        {"config", required_argument, nullptr, 'c'},
        {"reload", no_argument, nullptr, 'r'},
        {"check", no_argument, nullptr, 'k'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hi:e:d:n:c:rkv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'i': input = optarg; break;
            case 'e': expected_version = optarg; break;
            case 'd': install_cli = optarg; break;
            case 'n': ns_cli = optarg; break;
            case 'c': config_cli = optarg; break;
            case 'r': reload_only = true; break;
            case 'k': check_only = true; break;
            case 'v': verbose = true; break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if ((input != nullptr) + reload_only + check_only != 1) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    std::string config_path = kDefaultConfigPath;
    bool config_required = false;
    if (config_cli) {
        config_path = config_cli;
        config_required = true;
    } else if (const char* env = std::getenv("HOTSWAP_CONFIG_PATH"); env && *env) {
        config_path = env;
        config_required = true;
    }

    hotswap::config::UpdaterConfig cfg;
    if (!cfg.LoadFile(config_path)) {
        if (config_required) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
            return kExitFailed;
        }
        cfg.Reset();
    }
    if (install_cli) cfg.install_dir = install_cli;
    if (ns_cli) cfg.extension_namespace = ns_cli;
    if (cfg.log_level) hotswap::Logger::Instance().SetLevel(*cfg.log_level);
    if (verbose) hotswap::Logger::Instance().SetLevel(hotswap::LogLevel::Debug);

    if (cfg.install_dir.empty()) {
        std::fprintf(stderr, "ERROR: no install directory (use -d or install_dir in config)\n");
        return kExitUsage;
    }

    hotswap::ExtensionHost host(cfg.extension_namespace, cfg.install_dir, cfg.entry_point);
    auto load = host.LoadInstalled();
    if (!load.is_ok()) {
        if (!input) {
            std::fprintf(stderr, "ERROR: %s\n", load.msg.c_str());
            return kExitFailed;
        }
        LogInfo("%s", load.msg.c_str());
    }

    hotswap::ReadinessVerifier verifier(host.Modules(),
                                        host.Capabilities(),
                                        hotswap::ReadinessVerifier::Options{
                                            .ui_prefix = cfg.EffectiveUiPrefix(),
                                            .command_prefix = cfg.EffectiveCommandPrefix(),
                                            .min_ui_surfaces = cfg.min_ui_surfaces,
                                            .min_commands = cfg.min_commands,
                                            .settings_probe_field = cfg.settings_probe_field,
                                        });

    if (check_only) {
        const auto report = verifier.CheckReady(cfg.extension_namespace);
        std::fprintf(stdout, "%s: %s\n", report.ready ? "ready" : "not ready", report.detail.c_str());
        return report.ready ? kExitOk : kExitFailed;
    }

    hotswap::DeferredTaskQueue scheduler;
    ConsoleNotifier notifier;
    hotswap::UpdateOrchestrator orchestrator(
        hotswap::UpdateOrchestrator::Options{
            .extension_namespace = cfg.extension_namespace,
            .install_dir = cfg.install_dir,
            .entry_point = cfg.entry_point,
            .verify_delay = std::chrono::milliseconds(cfg.verify_delay_ms),
            .reconfigure_delay = std::chrono::milliseconds(cfg.reconfigure_delay_ms),
            .external_cancel = &hotswap::g_cancel,
            .backup_clock = {},
        },
        host.Modules(),
        verifier,
        scheduler,
        &notifier);

    if (reload_only) {
        hotswap::ReloadReport report;
        auto res = orchestrator.HotReload(report);
        for (const auto& [name, outcome] : report.outcomes) {
            std::fprintf(stdout, "%-40s %s%s%s\n",
                         name.c_str(),
                         hotswap::ToString(outcome.status),
                         outcome.error.empty() ? "" : ": ",
                         outcome.error.c_str());
        }
        if (!res.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
            return kExitFailed;
        }
        return kExitOk;
    }

    const auto outcome = orchestrator.Run(input, expected_version ? expected_version : "");

    // A fresh install has nothing to reload; the host picks it up now.
    if (outcome.Succeeded() && !host.Modules().Contains(cfg.extension_namespace)) {
        auto lr = host.LoadInstalled();
        if (!lr.is_ok()) {
            LogWarn("loading new installation failed: %s", lr.msg.c_str());
        }
    }

    // Let the deferred re-check and reconfigure run before the process exits.
    scheduler.RunUntilIdle();

    if (!outcome.retained_backup.empty()) {
        std::fprintf(stderr, "Backup kept at: %s\n", outcome.retained_backup.c_str());
    }
    return ExitCodeFor(outcome);
}
