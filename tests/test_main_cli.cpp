#include "testing.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <sys/wait.h>

#ifndef HOTSWAP_BIN
#error "HOTSWAP_BIN must point at the hotswap executable"
#endif

namespace {

namespace fs = std::filesystem;

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

CommandResult RunHotswap(const std::string& args) {
    const std::string cmd = std::string(HOTSWAP_BIN) + " " + args + " 2>/dev/null";
    CommandResult r;
    FILE* p = ::popen(cmd.c_str(), "r");
    if (!p) return r;
    std::array<char, 512> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), p)) {
        r.output += buf.data();
    }
    const int status = ::pclose(p);
    r.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return r;
}

class HotswapCliTest : public ::testing::Test {
  protected:
    void SetUp() override {
        install_ = tmp.Sub("addons/demo");
        config_ = tmp.Sub("hotswap.conf");
        testutil::WriteFile(config_,
                            R"({"namespace": "demo", "install_dir": ")" + install_ +
                                R"(", "verify_delay_ms": 10, "reconfigure_delay_ms": 20, "log_level": "error"})");
    }

    std::string Args(const std::string& extra) const { return "-c " + config_ + " " + extra; }

    testutil::TemporaryDirectory tmp;
    std::string install_;
    std::string config_;
};

TEST_F(HotswapCliTest, UsageErrors) {
    EXPECT_EQ(RunHotswap("").exit_code, 2);
    EXPECT_EQ(RunHotswap("--bogus").exit_code, 2);
    EXPECT_EQ(RunHotswap(Args("--reload --check")).exit_code, 2);
    EXPECT_EQ(RunHotswap("-h").exit_code, 0);
}

TEST_F(HotswapCliTest, InstallsUpdateAndReportsReady) {
    testutil::InstallTree(install_, "1.0.0");
    const std::string archive = tmp.Sub("demo-2.0.0.zip");
    testutil::BuildArchive(archive, testutil::ExtensionEntries("demo-2.0.0", "2.0.0"));

    const auto install = RunHotswap(Args("-i " + archive));
    EXPECT_EQ(install.exit_code, 0);
    EXPECT_NE(install.output.find("[hotswap] OK"), std::string::npos);
    EXPECT_EQ(testutil::ReadFile(fs::path(install_) / "README"), "readme 2.0.0\n");
    EXPECT_FALSE(fs::exists(tmp.Sub("addons/demo_staging")));

    const auto check = RunHotswap(Args("--check"));
    EXPECT_EQ(check.exit_code, 0);
    EXPECT_NE(check.output.find("All features ready (6 UI surfaces, 10 commands)"), std::string::npos);
}

TEST_F(HotswapCliTest, FreshInstall) {
    const std::string archive = tmp.Sub("demo.tar.gz");
    testutil::BuildArchive(archive, testutil::ExtensionEntries("demo", "1.0.0"), testutil::ArchiveFormat::TarGz);

    EXPECT_EQ(RunHotswap(Args("-i " + archive)).exit_code, 0);
    EXPECT_EQ(testutil::ReadFile(fs::path(install_) / "extension.json"), testutil::ManifestJson("1.0.0"));
}

TEST_F(HotswapCliTest, ExpectedVersionMismatchStillInstalls) {
    testutil::InstallTree(install_, "1.0.0");
    const std::string archive = tmp.Sub("demo-2.0.0.zip");
    testutil::BuildArchive(archive, testutil::ExtensionEntries("demo-2.0.0", "2.0.0"));

    EXPECT_EQ(RunHotswap(Args("-i " + archive + " --expect-version 2.0.1")).exit_code, 0);
    EXPECT_EQ(testutil::ReadFile(fs::path(install_) / "README"), "readme 2.0.0\n");
}

TEST_F(HotswapCliTest, InvalidArchiveFails) {
    testutil::InstallTree(install_, "1.0.0");
    const auto before = testutil::SnapshotTree(install_);
    const std::string archive = tmp.Sub("junk.zip");
    testutil::WriteFile(archive, "junk");

    const auto r = RunHotswap(Args("-i " + archive));
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_NE(r.output.find("[hotswap] FAILED"), std::string::npos);
    EXPECT_EQ(testutil::SnapshotTree(install_), before);
}

TEST_F(HotswapCliTest, ReloadAndCheckNeedAnInstallation) {
    EXPECT_EQ(RunHotswap(Args("--reload")).exit_code, 1);
    EXPECT_EQ(RunHotswap(Args("--check")).exit_code, 1);

    testutil::InstallTree(install_, "1.0.0");
    const auto r = RunHotswap(Args("--reload"));
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.output.find("reloaded"), std::string::npos);
}

TEST_F(HotswapCliTest, MissingExplicitConfigFails) {
    EXPECT_EQ(RunHotswap("-c " + tmp.Sub("nope.conf") + " --check").exit_code, 1);
}

} // namespace
