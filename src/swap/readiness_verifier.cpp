#include "swap/readiness_verifier.hpp"

namespace hotswap {

namespace {

std::string Shortfall(std::size_t have, std::size_t want, const char* what) {
    return "Only " + std::to_string(have) + "/" + std::to_string(want) + " " + what +
           " registered (" + std::to_string(want - have) + " missing)";
}

} // namespace

ReadinessReport ReadinessVerifier::CheckReady(const std::string& ns) const {
    ReadinessReport report;

    if (!modules_.Contains(ns)) {
        report.detail = ns + " not in module registry";
        return report;
    }

    if (!capabilities_.FindMetadata(ns)) {
        report.detail = "extension metadata not found";
        return report;
    }

    report.ui_surfaces = capabilities_.ListUiSurfaces(opt_.ui_prefix).size();
    report.commands = capabilities_.ListCommands(opt_.command_prefix).size();

    if (report.ui_surfaces < opt_.min_ui_surfaces) {
        report.detail = Shortfall(report.ui_surfaces, opt_.min_ui_surfaces, "UI surfaces");
        return report;
    }

    if (report.commands < opt_.min_commands) {
        report.detail = Shortfall(report.commands, opt_.min_commands, "commands");
        return report;
    }

    const nlohmann::json* settings = capabilities_.FindSettings(ns);
    if (!settings) {
        report.detail = "settings not attached to session";
        return report;
    }
    try {
        (void)settings->at(opt_.settings_probe_field);
    } catch (const nlohmann::json::exception& e) {
        report.detail = std::string("settings not accessible: ") + e.what();
        return report;
    }

    report.ready = true;
    report.detail = "All features ready (" + std::to_string(report.ui_surfaces) + " UI surfaces, " +
                    std::to_string(report.commands) + " commands)";
    return report;
}

} // namespace hotswap
