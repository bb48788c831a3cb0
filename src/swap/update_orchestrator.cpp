#include "swap/update_orchestrator.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

namespace hotswap {

namespace {

std::atomic_bool g_update_in_progress{false};

// Process-wide re-entrancy guard around Run() and HotReload().
class InProgressGuard {
  public:
    InProgressGuard() {
        bool expected = false;
        acquired_ = g_update_in_progress.compare_exchange_strong(expected, true);
    }
    InProgressGuard(const InProgressGuard&) = delete;
    InProgressGuard& operator=(const InProgressGuard&) = delete;
    ~InProgressGuard() {
        if (acquired_) g_update_in_progress.store(false);
    }

    bool acquired() const { return acquired_; }

  private:
    bool acquired_ = false;
};

} // namespace

const char* ToString(UpdateState s) {
    switch (s) {
        case UpdateState::Idle:       return "Idle";
        case UpdateState::Validating: return "Validating";
        case UpdateState::Staging:    return "Staging";
        case UpdateState::BackingUp:  return "BackingUp";
        case UpdateState::Replacing:  return "Replacing";
        case UpdateState::Reloading:  return "Reloading";
        case UpdateState::Verifying:  return "Verifying";
        case UpdateState::Succeeded:  return "Succeeded";
        case UpdateState::RolledBack: return "RolledBack";
        case UpdateState::Failed:     return "Failed";
    }
    return "Unknown";
}

const char* ToString(UpdateError e) {
    switch (e) {
        case UpdateError::None:       return "none";
        case UpdateError::Validation: return "validation";
        case UpdateError::Staging:    return "staging";
        case UpdateError::Backup:     return "backup";
        case UpdateError::Replace:    return "replace";
        case UpdateError::Reload:     return "reload";
        case UpdateError::Rollback:   return "rollback";
        case UpdateError::Cancelled:  return "cancelled";
        case UpdateError::Busy:       return "busy";
    }
    return "unknown";
}

UpdateOrchestrator::UpdateOrchestrator(Options opt,
                                       ModuleRegistry& modules,
                                       const ReadinessVerifier& verifier,
                                       IScheduler& scheduler,
                                       INotifier* notifier,
                                       std::shared_ptr<const IFilesystemOps> fs_ops)
    : opt_(std::move(opt)),
      fs_ops_(fs_ops ? std::move(fs_ops) : DefaultFilesystemOps()),
      modules_(modules),
      verifier_(verifier),
      scheduler_(scheduler),
      notifier_(notifier),
      validator_(opt_.entry_point),
      extractor_(ArchiveExtractor::Options{.safe_paths_only = true, .cancel = &cancel_}),
      backup_manager_(fs_ops_, opt_.backup_clock),
      installer_(fs_ops_),
      reloader_(opt_.reloader ? opt_.reloader : std::make_shared<ModuleReloader>(modules)) {}

bool UpdateOrchestrator::UpdateInProgress() {
    return g_update_in_progress.load();
}

std::string UpdateOrchestrator::StagingPath() const {
    const fs::path install = fs::path(opt_.install_dir).lexically_normal();
    const fs::path dir = install.has_filename() ? install : install.parent_path();
    return (dir.parent_path() / (dir.filename().string() + "_staging")).string();
}

bool UpdateOrchestrator::IsCancelled() const {
    if (cancel_.load(std::memory_order_relaxed)) return true;
    return opt_.external_cancel && opt_.external_cancel->load(std::memory_order_relaxed);
}

void UpdateOrchestrator::Transition(UpdateState next) {
    LogInfo("[update] %s -> %s", ToString(state_), ToString(next));
    state_ = next;
}

UpdateOutcome UpdateOrchestrator::Run(const std::string& archive_path, std::string_view expected_version) {
    UpdateOutcome out;

    InProgressGuard guard;
    if (!guard.acquired()) {
        // Not ours to touch: the running attempt owns staging and backup.
        out.state = UpdateState::Failed;
        out.error = UpdateError::Busy;
        out.message = "another update is already in progress";
        LogError("[update] %s", out.message.c_str());
        if (notifier_) notifier_->Notify(false, out.message);
        return out;
    }

    cancel_.store(false, std::memory_order_relaxed);
    delayed_report_.reset();
    state_ = UpdateState::Idle;
    LogInfo("[update] installing %s from %s", opt_.extension_namespace.c_str(), archive_path.c_str());

    Transition(UpdateState::Validating);
    ArtifactInfo info;
    auto vr = validator_.Validate(archive_path, info);
    if (!vr.is_ok()) {
        return Finish(UpdateState::Failed, UpdateError::Validation, vr.msg, std::move(out));
    }
    out.version = info.version;
    if (!expected_version.empty()) {
        if (out.version.empty()) {
            out.version = std::string(expected_version);
        } else if (out.version != expected_version) {
            LogWarn("[update] artifact declares version %s, expected %.*s",
                    out.version.c_str(),
                    (int)expected_version.size(),
                    expected_version.data());
        }
    }
    LogInfo("[update] artifact valid (root=%s, %llu entries, version=%s)",
            info.root_folder.c_str(),
            (unsigned long long)info.entry_count,
            info.version.empty() ? "unknown" : info.version.c_str());

    if (IsCancelled()) {
        return Finish(UpdateState::Idle, UpdateError::Cancelled, "cancelled before staging", std::move(out));
    }

    Transition(UpdateState::Staging);
    std::string staged_root;
    auto sr = Stage(archive_path, info, staged_root);
    if (!sr.is_ok()) {
        if (sr.err == ECANCELED) {
            return Finish(UpdateState::Idle, UpdateError::Cancelled, sr.msg, std::move(out));
        }
        return Finish(UpdateState::Failed, UpdateError::Staging, sr.msg, std::move(out));
    }
    if (IsCancelled()) {
        return Finish(UpdateState::Idle, UpdateError::Cancelled, "cancelled before backup", std::move(out));
    }

    BackupSnapshot backup;
    if (fs_ops_->Exists(opt_.install_dir)) {
        Transition(UpdateState::BackingUp);
        auto br = backup_manager_.Backup(opt_.install_dir, backup);
        if (!br.is_ok()) {
            return Finish(UpdateState::Failed, UpdateError::Backup, br.msg, std::move(out));
        }
        out.backup_created = true;
        LogInfo("[update] backed up to %s", backup.path.c_str());
    } else {
        LogInfo("[update] no existing installation at %s, skipping backup", opt_.install_dir.c_str());
    }

    // From here on every failure is converted into a rollback.
    try {
        Transition(UpdateState::Replacing);
        auto rr = installer_.Replace(staged_root, opt_.install_dir);
        if (!rr.is_ok()) {
            return RollBack(UpdateError::Replace, rr.msg, backup, std::move(out));
        }
        LogInfo("[update] files replaced");

        Transition(UpdateState::Reloading);
        out.reload = reloader_->Reload(opt_.extension_namespace);
        LogInfo("[update] reloaded %zu/%zu modules (%zu evicted)",
                out.reload.reloaded,
                out.reload.discovered,
                out.reload.Evicted());

        Transition(UpdateState::Verifying);
        out.readiness = verifier_.CheckReady(opt_.extension_namespace);
    } catch (const std::exception& e) {
        const UpdateError cause =
            state_ == UpdateState::Replacing ? UpdateError::Replace : UpdateError::Reload;
        return RollBack(cause, std::string("exception: ") + e.what(), backup, std::move(out));
    } catch (...) {
        const UpdateError cause =
            state_ == UpdateState::Replacing ? UpdateError::Replace : UpdateError::Reload;
        return RollBack(cause, "unknown exception", backup, std::move(out));
    }

    if (out.readiness.ready) {
        LogInfo("[update] immediate check: %s", out.readiness.detail.c_str());
    } else {
        LogWarn("[update] immediate check: %s", out.readiness.detail.c_str());
        LogWarn("[update] extension may still be initializing, re-checking in %lld ms",
                (long long)opt_.verify_delay.count());
    }
    ScheduleFollowUps(out.readiness.ready);

    auto dr = backup_manager_.Discard(backup);
    if (!dr.is_ok()) {
        LogWarn("[update] could not remove backup %s: %s", backup.path.c_str(), dr.msg.c_str());
    }

    std::string message = "update complete";
    if (!out.version.empty()) message += ", version " + out.version;
    message += ", reloaded without restart";
    return Finish(UpdateState::Succeeded, UpdateError::None, std::move(message), std::move(out));
}

Result UpdateOrchestrator::Stage(const std::string& archive_path,
                                 const ArtifactInfo& info,
                                 std::string& out_root) {
    const std::string staging = StagingPath();

    if (fs_ops_->Exists(staging)) {
        auto rm = fs_ops_->RemoveTree(staging);
        if (!rm.is_ok()) return Result::Fail(rm.err, "cannot clear stale staging: " + rm.msg);
    }
    auto mk = fs_ops_->CreateDirectories(staging);
    if (!mk.is_ok()) return mk;

    std::uint64_t bytes = 0;
    auto er = extractor_.ExtractToDir(archive_path, staging, &bytes);
    if (!er.is_ok()) return er;

    out_root = (fs::path(staging) / info.root_folder).string();
    const std::string entry_point = (fs::path(out_root) / opt_.entry_point).string();
    std::error_code ec;
    if (!fs::is_regular_file(entry_point, ec) || ec) {
        return Result::Fail(ENOENT, "extracted extension has no " + opt_.entry_point);
    }

    LogInfo("[update] extracted %llu bytes to %s", (unsigned long long)bytes, out_root.c_str());
    return Result::Ok();
}

UpdateOutcome UpdateOrchestrator::RollBack(UpdateError cause,
                                           const std::string& reason,
                                           const BackupSnapshot& backup,
                                           UpdateOutcome out) {
    LogError("[update] %s failed: %s", ToString(state_), reason.c_str());
    LogWarn("[update] rolling back %s", opt_.install_dir.c_str());

    if (!backup.Empty()) {
        auto rr = backup_manager_.Restore(backup, opt_.install_dir);
        if (!rr.is_ok()) {
            out.retained_backup = backup.path;
            LogError("[update] restore failed: %s", rr.msg.c_str());
            return Finish(UpdateState::Failed,
                          UpdateError::Rollback,
                          "manual recovery required, backup retained at " + backup.path,
                          std::move(out));
        }
    } else {
        // Fresh install: the previous state is "nothing installed".
        auto rm = fs_ops_->RemoveTree(opt_.install_dir);
        if (!rm.is_ok()) {
            LogError("[update] cannot remove partial installation: %s", rm.msg.c_str());
            return Finish(UpdateState::Failed,
                          UpdateError::Rollback,
                          "manual recovery required, partial installation left at " +
                              opt_.install_dir,
                          std::move(out));
        }
    }

    // Bring the host back onto the restored code.
    try {
        const ReloadReport restored = reloader_->Reload(opt_.extension_namespace);
        LogInfo("[update] reloaded %zu/%zu modules from restored installation",
                restored.reloaded,
                restored.discovered);
    } catch (const std::exception& e) {
        LogWarn("[update] reload after restore failed: %s", e.what());
    } catch (...) {
        LogWarn("[update] reload after restore failed: unknown exception");
    }

    auto dr = backup_manager_.Discard(backup);
    if (!dr.is_ok()) {
        LogWarn("[update] could not remove backup %s: %s", backup.path.c_str(), dr.msg.c_str());
    }

    return Finish(UpdateState::RolledBack,
                  cause,
                  std::string(ToString(cause)) + " failed, previous version restored: " + reason,
                  std::move(out));
}

UpdateOutcome UpdateOrchestrator::Finish(UpdateState terminal,
                                         UpdateError error,
                                         std::string message,
                                         UpdateOutcome out) {
    CleanupStaging();
    Transition(terminal);

    out.state = terminal;
    out.error = error;
    out.message = std::move(message);

    if (terminal == UpdateState::Succeeded) {
        LogInfo("[update] SUCCEEDED: %s", out.message.c_str());
    } else if (terminal == UpdateState::Idle) {
        LogWarn("[update] CANCELLED: %s", out.message.c_str());
    } else {
        LogError("[update] %s (%s): %s", ToString(terminal), ToString(error), out.message.c_str());
    }

    if (notifier_) notifier_->Notify(out.Succeeded(), out.message);
    return out;
}

void UpdateOrchestrator::CleanupStaging() {
    const std::string staging = StagingPath();
    if (!fs_ops_->Exists(staging)) return;
    auto rm = fs_ops_->RemoveTree(staging);
    if (!rm.is_ok()) {
        LogWarn("[update] could not remove staging %s: %s", staging.c_str(), rm.msg.c_str());
    }
}

void UpdateOrchestrator::ScheduleFollowUps(bool ready) {
    const std::string ns = opt_.extension_namespace;

    if (!ready) {
        // Diagnostic only: the outcome has already been reported.
        scheduler_.Schedule(opt_.verify_delay, [this, ns] {
            delayed_report_ = verifier_.CheckReady(ns);
            if (delayed_report_->ready) {
                LogInfo("[update] delayed check: %s", delayed_report_->detail.c_str());
            } else {
                LogWarn("[update] delayed check: %s", delayed_report_->detail.c_str());
            }
        });
    }

    scheduler_.Schedule(opt_.reconfigure_delay, [this, ns] {
        ILoadedModule* root = modules_.Find(ns);
        if (!root) {
            LogWarn("[update] %s not loaded, skipping reconfigure", ns.c_str());
            return;
        }
        auto res = root->Configure();
        if (res.is_ok()) {
            LogInfo("[update] %s reconfigured", ns.c_str());
        } else {
            LogWarn("[update] reconfigure of %s failed: %s", ns.c_str(), res.msg.c_str());
        }
    });
}

Result UpdateOrchestrator::HotReload(ReloadReport& out) {
    InProgressGuard guard;
    if (!guard.acquired()) {
        return Result::Fail(EBUSY, "an update is in progress");
    }

    LogInfo("[reload] reloading %s", opt_.extension_namespace.c_str());
    out = reloader_->Reload(opt_.extension_namespace);
    LogInfo("[reload] reloaded %zu/%zu modules", out.reloaded, out.discovered);

    if (ILoadedModule* root = modules_.Find(opt_.extension_namespace)) {
        auto cr = root->Configure();
        if (!cr.is_ok()) {
            LogWarn("[reload] reconfigure failed: %s", cr.msg.c_str());
        }
    }

    if (out.Evicted() > 0) {
        return Result::Fail(-1, std::to_string(out.Evicted()) + " module(s) failed to reload");
    }
    return Result::Ok();
}

} // namespace hotswap
