#include "swap/artifact_validator.hpp"
#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace hotswap {
namespace {

namespace fs = std::filesystem;

class ArtifactValidatorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    ArtifactValidator validator{"extension.json"};

    std::string Zip(const std::vector<testutil::ArchiveEntry>& entries,
                    testutil::ArchiveFormat format = testutil::ArchiveFormat::Zip) {
        const std::string path = tmp.Sub("artifact-" + std::to_string(counter_++));
        testutil::BuildArchive(path, entries, format);
        return path;
    }

  private:
    int counter_ = 0;
};

TEST_F(ArtifactValidatorTest, AcceptsWellFormedZip) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip(testutil::ExtensionEntries("demo", "2.0.0")), info);

    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(info.root_folder, "demo");
    EXPECT_EQ(info.entry_count, 5U);
    EXPECT_EQ(info.version, "2.0.0");
}

TEST_F(ArtifactValidatorTest, AcceptsTarGzWithoutDirectoryEntries) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({{"demo/extension.json", "{}", AE_IFREG},
                                       {"demo/lib/unit.so", "ELF", AE_IFREG}},
                                      testutil::ArchiveFormat::TarGz),
                                  info);

    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(info.root_folder, "demo");
    EXPECT_TRUE(info.version.empty());
}

TEST_F(ArtifactValidatorTest, RejectsMissingFile) {
    ArtifactInfo info;
    auto res = validator.Validate(tmp.Sub("nope.zip"), info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("not found"), std::string::npos);
}

TEST_F(ArtifactValidatorTest, RejectsDirectory) {
    ArtifactInfo info;
    EXPECT_FALSE(validator.Validate(tmp.Path(), info).is_ok());
}

TEST_F(ArtifactValidatorTest, RejectsNonArchive) {
    const std::string path = tmp.Sub("notes.zip");
    testutil::WriteFile(path, "this is plain text, not an archive\n");

    ArtifactInfo info;
    auto res = validator.Validate(path, info);
    ASSERT_FALSE(res.is_ok());
}

TEST_F(ArtifactValidatorTest, RejectsTruncatedArchive) {
    const std::string path = Zip(testutil::ExtensionEntries("demo", "2.0.0"));
    fs::resize_file(path, 40);

    ArtifactInfo info;
    EXPECT_FALSE(validator.Validate(path, info).is_ok());
}

TEST_F(ArtifactValidatorTest, RejectsEmptyArchive) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({}), info);
    ASSERT_FALSE(res.is_ok());
}

TEST_F(ArtifactValidatorTest, RejectsMissingEntryPoint) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({{"demo/", "", AE_IFDIR},
                                       {"demo/README", "hi", AE_IFREG}}),
                                  info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("has no extension.json"), std::string::npos);
}

TEST_F(ArtifactValidatorTest, RejectsEntryPointBelowTopLevel) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({{"demo/nested/extension.json", "{}", AE_IFREG}}), info);
    ASSERT_FALSE(res.is_ok());
}

TEST_F(ArtifactValidatorTest, RejectsSeveralRootFolders) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({{"demo/extension.json", "{}", AE_IFREG},
                                       {"other/extension.json", "{}", AE_IFREG}}),
                                  info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("more than one root folder"), std::string::npos);
}

TEST_F(ArtifactValidatorTest, RejectsBareTopLevelFile) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({{"extension.json", "{}", AE_IFREG}}), info);
    ASSERT_FALSE(res.is_ok());
}

TEST_F(ArtifactValidatorTest, RejectsUnsafePaths) {
    ArtifactInfo info;
    auto res = validator.Validate(Zip({{"demo/extension.json", "{}", AE_IFREG},
                                       {"demo/../../evil", "x", AE_IFREG}}),
                                  info);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe path"), std::string::npos);
}

} // namespace
} // namespace hotswap
