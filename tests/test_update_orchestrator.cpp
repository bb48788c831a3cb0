#include "host/extension_host.hpp"
#include "host/scheduler.hpp"
#include "swap/update_orchestrator.hpp"
#include "testing.hpp"
#include "util/logger.hpp"

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <system_error>

namespace hotswap {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class RecordingNotifier final : public INotifier {
  public:
    void Notify(bool success, std::string_view summary) override {
        ++calls;
        last_success = success;
        last_summary = std::string(summary);
    }

    int calls = 0;
    bool last_success = false;
    std::string last_summary;
};

// Raises from the first Reload() call, then behaves like the real reloader so
// the restored installation can be brought back.
class FailingFirstReloader final : public IModuleReloader {
  public:
    FailingFirstReloader(ModuleRegistry& registry, std::function<void()> raise)
        : real_(registry), raise_(std::move(raise)) {}

    ReloadReport Reload(std::string_view prefix) override {
        if (calls++ == 0) raise_();
        return real_.Reload(prefix);
    }

    int calls = 0;

  private:
    ModuleReloader real_;
    std::function<void()> raise_;
};

// Archive entries for a release whose manifest declares `ui`/`cmds` capabilities.
std::vector<testutil::ArchiveEntry> ReleaseEntries(const std::string& root,
                                                   const std::string& version,
                                                   int ui = 6,
                                                   int cmds = 10) {
    auto entries = testutil::ExtensionEntries(root, version);
    for (auto& e : entries) {
        if (e.path == root + "/extension.json") e.contents = testutil::ManifestJson(version, ui, cmds);
    }
    return entries;
}

class UpdateOrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        Logger::Instance().SetLevel(LogLevel::Debug);
        fs::create_directories(tmp.Sub("addons"));
        install_ = tmp.Sub("addons/demo");
        staging_ = tmp.Sub("addons/demo_staging");
    }

    void InstallV1() {
        testutil::InstallTree(install_, "1.0.0");
        ASSERT_TRUE(host_.LoadInstalled().is_ok());
    }

    std::string Archive(const std::vector<testutil::ArchiveEntry>& entries,
                        testutil::ArchiveFormat format = testutil::ArchiveFormat::Zip) {
        const std::string path = tmp.Sub(format == testutil::ArchiveFormat::Zip ? "release.zip" : "release.tar.gz");
        testutil::BuildArchive(path, entries, format);
        return path;
    }

    std::unique_ptr<UpdateOrchestrator> Make(std::shared_ptr<const IFilesystemOps> fs_ops = nullptr,
                                             const std::atomic_bool* cancel = nullptr,
                                             std::shared_ptr<IModuleReloader> reloader = nullptr) {
        return std::make_unique<UpdateOrchestrator>(
            UpdateOrchestrator::Options{
                .extension_namespace = "demo",
                .install_dir = install_,
                .entry_point = "extension.json",
                .verify_delay = 1000ms,
                .reconfigure_delay = 1500ms,
                .external_cancel = cancel,
                .backup_clock = {},
                .reloader = std::move(reloader),
            },
            host_.Modules(),
            verifier_,
            scheduler_,
            &notifier_,
            std::move(fs_ops));
    }

    std::vector<std::string> Backups() const {
        std::vector<std::string> out;
        for (const auto& e : fs::directory_iterator(tmp.Sub("addons"))) {
            if (e.path().filename().string().find("_backup_") != std::string::npos) {
                out.push_back(e.path().string());
            }
        }
        return out;
    }

    std::string InstalledVersion() {
        const auto* meta = host_.Capabilities().FindMetadata("demo");
        return meta ? meta->version : std::string();
    }

    testutil::TemporaryDirectory tmp;
    std::string install_;
    std::string staging_;

    ExtensionHost host_{"demo", tmp.Sub("addons/demo"), "extension.json"};
    ReadinessVerifier verifier_{host_.Modules(),
                                host_.Capabilities(),
                                ReadinessVerifier::Options{
                                    .ui_prefix = "demo_PT_",
                                    .command_prefix = "demo_OT_",
                                    .min_ui_surfaces = 6,
                                    .min_commands = 10,
                                    .settings_probe_field = "version",
                                }};
    DeferredTaskQueue scheduler_;
    RecordingNotifier notifier_;
};

TEST_F(UpdateOrchestratorTest, UpgradeReplacesAndReloads) {
    InstallV1();
    auto orch = Make();

    const auto out = orch->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    ASSERT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_EQ(out.error, UpdateError::None);
    EXPECT_EQ(out.version, "2.0.0");
    EXPECT_TRUE(out.backup_created);
    EXPECT_TRUE(out.retained_backup.empty());
    EXPECT_EQ(out.reload.reloaded, 1U);
    EXPECT_TRUE(out.readiness.ready) << out.readiness.detail;

    EXPECT_EQ(testutil::ReadFile(fs::path(install_) / "README"), "readme 2.0.0\n");
    EXPECT_EQ(InstalledVersion(), "2.0.0");
    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(staging_));
    EXPECT_EQ(orch->State(), UpdateState::Succeeded);

    EXPECT_EQ(notifier_.calls, 1);
    EXPECT_TRUE(notifier_.last_success);
    EXPECT_NE(notifier_.last_summary.find("2.0.0"), std::string::npos);

    // Ready right away: only the reconfigure is deferred.
    EXPECT_EQ(scheduler_.Pending(), 1U);
    host_.Capabilities().DetachSettings("demo");
    EXPECT_EQ(scheduler_.RunDue(DeferredTaskQueue::Clock::now() + 2s), 1U);
    EXPECT_NE(host_.Capabilities().FindSettings("demo"), nullptr);
    EXPECT_FALSE(orch->LastDelayedReport().has_value());
}

TEST_F(UpdateOrchestratorTest, FreshInstallSkipsBackup) {
    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    auto orch = Make(fs_ops);

    const auto out = orch->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0"), testutil::ArchiveFormat::TarGz));

    ASSERT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_FALSE(out.backup_created);
    EXPECT_EQ(fs_ops->copy_calls, 0);
    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(staging_));

    testutil::TemporaryDirectory expected;
    testutil::InstallTree(expected.Path(), "2.0.0");
    EXPECT_EQ(testutil::SnapshotTree(install_), testutil::SnapshotTree(expected.Path()));
}

TEST_F(UpdateOrchestratorTest, MissingEntryPointLeavesInstallationUntouched) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);
    auto orch = Make();

    const auto out = orch->Run(Archive({
        {"demo-2.0.0/", "", AE_IFDIR},
        {"demo-2.0.0/README", "readme 2.0.0\n", AE_IFREG},
    }));

    EXPECT_EQ(out.state, UpdateState::Failed);
    EXPECT_EQ(out.error, UpdateError::Validation);
    EXPECT_NE(out.message.find("extension.json"), std::string::npos);
    EXPECT_FALSE(out.backup_created);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_EQ(InstalledVersion(), "1.0.0");
    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(staging_));
    EXPECT_FALSE(notifier_.last_success);
    EXPECT_EQ(scheduler_.Pending(), 0U);
}

TEST_F(UpdateOrchestratorTest, CorruptArchiveLeavesInstallationUntouched) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);
    const std::string path = tmp.Sub("broken.zip");
    testutil::WriteFile(path, "definitely not an archive\n");

    const auto out = Make()->Run(path);

    EXPECT_EQ(out.state, UpdateState::Failed);
    EXPECT_EQ(out.error, UpdateError::Validation);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
}

TEST_F(UpdateOrchestratorTest, PermissionErrorDuringReplaceRollsBack) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);

    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    fs_ops->move_hook = [](std::string_view src, std::string_view dst) -> Result {
        throw fs::filesystem_error("rename", fs::path(src), fs::path(dst),
                                   std::make_error_code(std::errc::permission_denied));
    };
    auto orch = Make(fs_ops);

    const auto out = orch->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::RolledBack);
    EXPECT_EQ(out.error, UpdateError::Replace);
    EXPECT_TRUE(out.backup_created);
    EXPECT_TRUE(out.retained_backup.empty());
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(staging_));

    // The host runs the restored code again.
    EXPECT_EQ(InstalledVersion(), "1.0.0");
    EXPECT_TRUE(verifier_.CheckReady("demo").ready);
    EXPECT_FALSE(notifier_.last_success);
}

TEST_F(UpdateOrchestratorTest, ReplaceErrorResultRollsBack) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);

    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    // The move lands half the work, then reports an error.
    fs_ops->move_hook = [&fs_ops](std::string_view src, std::string_view dst) {
        EXPECT_TRUE(fs_ops->Real().Move(src, dst).is_ok());
        return Result::Fail(EIO, "Input/output error");
    };

    const auto out = Make(fs_ops)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::RolledBack);
    EXPECT_NE(out.message.find("Input/output error"), std::string::npos);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_TRUE(Backups().empty());
    fs_ops->move_hook = nullptr;
}

TEST_F(UpdateOrchestratorTest, ExceptionWhileReloadingRollsBack) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);

    auto reloader = std::make_shared<FailingFirstReloader>(
        host_.Modules(), [] { throw std::runtime_error("host import machinery failed"); });
    const auto out = Make(nullptr, nullptr, reloader)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::RolledBack);
    EXPECT_EQ(out.error, UpdateError::Reload);
    EXPECT_NE(out.message.find("host import machinery failed"), std::string::npos);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(staging_));

    // Second call reloads the restored installation.
    EXPECT_EQ(reloader->calls, 2);
    EXPECT_EQ(InstalledVersion(), "1.0.0");
    EXPECT_TRUE(verifier_.CheckReady("demo").ready);
    EXPECT_FALSE(notifier_.last_success);
}

TEST_F(UpdateOrchestratorTest, NonStandardExceptionWhileReloadingRollsBack) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);

    auto reloader = std::make_shared<FailingFirstReloader>(host_.Modules(), [] { throw 42; });
    const auto out = Make(nullptr, nullptr, reloader)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::RolledBack);
    EXPECT_EQ(out.error, UpdateError::Reload);
    EXPECT_NE(out.message.find("unknown exception"), std::string::npos);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(staging_));
    EXPECT_FALSE(UpdateOrchestrator::UpdateInProgress());
}

TEST_F(UpdateOrchestratorTest, UnitThrowingNonStandardTypeIsEvictedWithoutRollback) {
    InstallV1();
    ASSERT_TRUE(host_.Modules()
                    .Insert("demo.native", std::make_unique<testutil::FakeModule>(testutil::FakeModule::Mode::ThrowInt))
                    .is_ok());

    const auto out = Make()->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    ASSERT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_EQ(out.reload.discovered, 2U);
    EXPECT_EQ(out.reload.reloaded, 1U);
    EXPECT_EQ(out.reload.outcomes.at("demo.native").status, ReloadStatus::Evicted);
    EXPECT_FALSE(host_.Modules().Contains("demo.native"));
    EXPECT_EQ(InstalledVersion(), "2.0.0");
    EXPECT_TRUE(Backups().empty());
}

TEST_F(UpdateOrchestratorTest, ExpectedVersionMismatchOnlyWarns) {
    InstallV1();
    testutil::ScopedLogCapture logs;

    const auto out = Make()->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")), "2.1.0");

    ASSERT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_EQ(out.version, "2.0.0");
    EXPECT_TRUE(logs.Contains(LogLevel::Warn, "artifact declares version 2.0.0, expected 2.1.0"));
}

TEST_F(UpdateOrchestratorTest, ExpectedVersionFillsInWhenManifestHasNone) {
    const auto out = Make()->Run(Archive({
                                     {"demo/", "", AE_IFDIR},
                                     {"demo/extension.json", R"({"name":"Demo"})", AE_IFREG},
                                 }),
                                 "3.1.0");

    ASSERT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_EQ(out.version, "3.1.0");
    EXPECT_NE(notifier_.last_summary.find("3.1.0"), std::string::npos);
}

TEST_F(UpdateOrchestratorTest, FailedFreshInstallLeavesNothingBehind) {
    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    fs_ops->move_hook = [](std::string_view, std::string_view) {
        return Result::Fail(EACCES, "Permission denied");
    };

    const auto out = Make(fs_ops)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::RolledBack);
    EXPECT_FALSE(fs::exists(install_));
    EXPECT_FALSE(fs::exists(staging_));
}

TEST_F(UpdateOrchestratorTest, FailedRestoreRetainsBackup) {
    InstallV1();

    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    fs_ops->move_hook = [](std::string_view, std::string_view) {
        return Result::Fail(EACCES, "Permission denied");
    };
    // First copy is the backup, the second one is the restore.
    fs_ops->copy_hook = [&fs_ops](std::string_view src, std::string_view dst) {
        if (fs_ops->copy_calls == 1) return fs_ops->Real().CopyTree(src, dst);
        return Result::Fail(EROFS, "Read-only file system");
    };

    const auto out = Make(fs_ops)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::Failed);
    EXPECT_EQ(out.error, UpdateError::Rollback);
    ASSERT_FALSE(out.retained_backup.empty());
    EXPECT_NE(out.message.find("manual recovery required, backup retained at " + out.retained_backup),
              std::string::npos);
    EXPECT_TRUE(fs::is_directory(out.retained_backup));
    EXPECT_EQ(testutil::ReadFile(fs::path(out.retained_backup) / "README"), "readme 1.0.0\n");
    EXPECT_FALSE(fs::exists(staging_));

    fs_ops->move_hook = nullptr;
    fs_ops->copy_hook = nullptr;
}

TEST_F(UpdateOrchestratorTest, BackupFailureIsFatalBeforeAnyChange) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);

    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    fs_ops->copy_hook = [](std::string_view, std::string_view) {
        return Result::Fail(ENOSPC, "No space left on device");
    };

    const auto out = Make(fs_ops)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::Failed);
    EXPECT_EQ(out.error, UpdateError::Backup);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_FALSE(fs::exists(staging_));
}

TEST_F(UpdateOrchestratorTest, UnreadyVerificationStillSucceeds) {
    InstallV1();
    auto orch = Make();

    const auto out = orch->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0", 5, 12)));

    ASSERT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_FALSE(out.readiness.ready);
    EXPECT_NE(out.readiness.detail.find("UI surfaces"), std::string::npos);
    EXPECT_TRUE(Backups().empty());
    EXPECT_EQ(scheduler_.Pending(), 2U);

    const auto now = DeferredTaskQueue::Clock::now();
    EXPECT_EQ(scheduler_.RunDue(now + 1200ms), 1U);
    ASSERT_TRUE(orch->LastDelayedReport().has_value());
    EXPECT_FALSE(orch->LastDelayedReport()->ready);
    EXPECT_EQ(orch->LastDelayedReport()->detail, "Only 5/6 UI surfaces registered (1 missing)");

    EXPECT_EQ(scheduler_.RunDue(now + 2s), 1U);
    EXPECT_EQ(orch->State(), UpdateState::Succeeded);
    EXPECT_EQ(testutil::ReadFile(fs::path(install_) / "README"), "readme 2.0.0\n");
}

TEST_F(UpdateOrchestratorTest, CancelBeforeStagingReturnsToIdle) {
    InstallV1();
    const auto before = testutil::SnapshotTree(install_);
    std::atomic_bool cancel{true};

    const auto out = Make(nullptr, &cancel)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::Idle);
    EXPECT_EQ(out.error, UpdateError::Cancelled);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
    EXPECT_FALSE(fs::exists(staging_));
    EXPECT_TRUE(Backups().empty());
}

TEST_F(UpdateOrchestratorTest, CancelDuringBackupIsIgnored) {
    InstallV1();
    std::atomic_bool cancel{false};

    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    fs_ops->copy_hook = [&fs_ops, &cancel](std::string_view src, std::string_view dst) {
        cancel.store(true);
        return fs_ops->Real().CopyTree(src, dst);
    };

    const auto out = Make(fs_ops, &cancel)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_EQ(InstalledVersion(), "2.0.0");
    fs_ops->copy_hook = nullptr;
}

TEST_F(UpdateOrchestratorTest, ConcurrentRunIsRejected) {
    InstallV1();

    const std::string other_install = tmp.Sub("other/demo");
    UpdateOutcome nested;
    bool in_progress_seen = false;

    auto fs_ops = std::make_shared<testutil::FaultInjectingFs>();
    fs_ops->move_hook = [&](std::string_view src, std::string_view dst) {
        in_progress_seen = UpdateOrchestrator::UpdateInProgress();
        UpdateOrchestrator second(UpdateOrchestrator::Options{.extension_namespace = "demo",
                                                              .install_dir = other_install,
                                                              .entry_point = "extension.json",
                                                              .verify_delay = 1000ms,
                                                              .reconfigure_delay = 1500ms,
                                                              .external_cancel = nullptr,
                                                              .backup_clock = {}},
                                  host_.Modules(),
                                  verifier_,
                                  scheduler_);
        nested = second.Run(tmp.Sub("release.zip"));
        return fs_ops->Real().Move(src, dst);
    };

    const auto out = Make(fs_ops)->Run(Archive(ReleaseEntries("demo-2.0.0", "2.0.0")));

    EXPECT_EQ(out.state, UpdateState::Succeeded) << out.message;
    EXPECT_TRUE(in_progress_seen);
    EXPECT_EQ(nested.state, UpdateState::Failed);
    EXPECT_EQ(nested.error, UpdateError::Busy);
    EXPECT_FALSE(fs::exists(tmp.Sub("other")));
    EXPECT_FALSE(UpdateOrchestrator::UpdateInProgress());
    fs_ops->move_hook = nullptr;
}

TEST_F(UpdateOrchestratorTest, HotReloadWithoutArchive) {
    InstallV1();
    testutil::WriteFile(fs::path(install_) / "extension.json", testutil::ManifestJson("1.0.1"));

    ReloadReport report;
    ASSERT_TRUE(Make()->HotReload(report).is_ok());
    EXPECT_EQ(report.reloaded, 1U);
    EXPECT_EQ(InstalledVersion(), "1.0.1");
}

TEST_F(UpdateOrchestratorTest, HotReloadReportsEvictions) {
    InstallV1();
    testutil::WriteFile(fs::path(install_) / "extension.json", "{ broken");

    ReloadReport report;
    EXPECT_FALSE(Make()->HotReload(report).is_ok());
    EXPECT_EQ(report.Evicted(), 1U);
    EXPECT_FALSE(host_.Modules().Contains("demo"));
}

TEST(UpdateStateTest, Names) {
    EXPECT_STREQ(ToString(UpdateState::BackingUp), "BackingUp");
    EXPECT_STREQ(ToString(UpdateState::RolledBack), "RolledBack");
    EXPECT_STREQ(ToString(UpdateError::Rollback), "rollback");
}

} // namespace
} // namespace hotswap
