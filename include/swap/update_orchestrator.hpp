#pragma once

#include "host/module_registry.hpp"
#include "host/scheduler.hpp"
#include "swap/archive_extractor.hpp"
#include "swap/artifact_validator.hpp"
#include "swap/backup_manager.hpp"
#include "swap/filesystem_ops.hpp"
#include "swap/installer.hpp"
#include "swap/module_reloader.hpp"
#include "swap/readiness_verifier.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hotswap {

enum class UpdateState {
    Idle,
    Validating,
    Staging,
    BackingUp,
    Replacing,
    Reloading,
    Verifying,
    Succeeded,
    RolledBack,
    Failed,
};

enum class UpdateError {
    None,
    Validation,
    Staging,
    Backup,
    Replace,
    Reload,
    Rollback,   // restore failed, manual recovery required
    Cancelled,
    Busy,
};

const char* ToString(UpdateState s);
const char* ToString(UpdateError e);

struct UpdateOutcome {
    UpdateState state = UpdateState::Idle;
    UpdateError error = UpdateError::None;
    std::string message;

    std::string version;
    bool backup_created = false;
    // Only set when rollback failed and the backup was kept for manual recovery.
    std::string retained_backup;

    ReloadReport reload;
    ReadinessReport readiness;

    bool Succeeded() const { return state == UpdateState::Succeeded; }
};

// Host-native surface for the final result (status bar, popup, ...).
class INotifier {
  public:
    virtual ~INotifier() = default;
    virtual void Notify(bool success, std::string_view summary) = 0;
};

/**
 * @brief Runs one update as a single synchronous transaction:
 *        validate -> stage -> back up -> replace -> reload -> verify.
 *
 * Failures before Replacing leave the installation untouched. Any failure from
 * Replacing onward restores the backup. An unready verification never fails
 * the update; it only schedules a delayed diagnostic re-check.
 *
 * The orchestrator must outlive the tasks it hands to the scheduler.
 */
class UpdateOrchestrator {
  public:
    struct Options {
        std::string extension_namespace;
        std::string install_dir;
        std::string entry_point = "extension.json";
        std::chrono::milliseconds verify_delay{1000};
        std::chrono::milliseconds reconfigure_delay{1500};
        // Checked alongside RequestCancel(), e.g. the process signal flag.
        const std::atomic_bool* external_cancel = nullptr;
        BackupManager::Clock backup_clock;
        // Defaults to a ModuleReloader over the registry passed to the constructor.
        std::shared_ptr<IModuleReloader> reloader;
    };

    UpdateOrchestrator(Options opt,
                       ModuleRegistry& modules,
                       const ReadinessVerifier& verifier,
                       IScheduler& scheduler,
                       INotifier* notifier = nullptr,
                       std::shared_ptr<const IFilesystemOps> fs_ops = nullptr);

    // `expected_version` is what the caller believes the artifact holds, e.g.
    // the release tag it downloaded. The manifest version wins on mismatch.
    UpdateOutcome Run(const std::string& archive_path, std::string_view expected_version = {});

    // Reloads the extension in place without an archive. Fails while an
    // update is running.
    Result HotReload(ReloadReport& out);

    // Honoured until the backup starts; ignored afterwards.
    void RequestCancel() { cancel_.store(true, std::memory_order_relaxed); }

    UpdateState State() const { return state_; }
    std::string StagingPath() const;
    const std::optional<ReadinessReport>& LastDelayedReport() const { return delayed_report_; }

    static bool UpdateInProgress();

  private:
    bool IsCancelled() const;
    void Transition(UpdateState next);

    Result Stage(const std::string& archive_path, const ArtifactInfo& info, std::string& out_root);
    UpdateOutcome RollBack(UpdateError cause,
                           const std::string& reason,
                           const BackupSnapshot& backup,
                           UpdateOutcome out);
    UpdateOutcome Finish(UpdateState terminal, UpdateError error, std::string message, UpdateOutcome out);
    void CleanupStaging();
    void ScheduleFollowUps(bool ready);

    Options opt_;
    std::shared_ptr<const IFilesystemOps> fs_ops_;
    ModuleRegistry& modules_;
    const ReadinessVerifier& verifier_;
    IScheduler& scheduler_;
    INotifier* notifier_ = nullptr;

    ArtifactValidator validator_;
    ArchiveExtractor extractor_;
    BackupManager backup_manager_;
    Installer installer_;
    std::shared_ptr<IModuleReloader> reloader_;

    std::atomic_bool cancel_{false};
    UpdateState state_ = UpdateState::Idle;
    std::optional<ReadinessReport> delayed_report_;
};

} // namespace hotswap
