#include <gtest/gtest.h>
#include <jdkrun/platform/platform_ops.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace jdkrun;
namespace fs = std::filesystem;

namespace {

struct PlatformOpsFixture : public ::testing::Test {
    fs::path root;
    std::unique_ptr<PlatformOps> ops;
    void SetUp() override {
        root = fs::temp_directory_path() / ("jdkrun_ops_" + std::to_string(::getpid()));
        fs::remove_all(root);
        ops = make_platform_ops();
    }
    void TearDown() override { fs::remove_all(root); }
};

} // namespace

TEST_F(PlatformOpsFixture, CreateIsIdempotentAndMakesParents) {
    auto dir = root / "a" / "b";
    ops->create_directory(dir.string());
    EXPECT_TRUE(fs::is_directory(dir));
    std::ofstream(dir / "keep.txt") << "k";
    ops->create_directory(dir.string());
    EXPECT_TRUE(fs::exists(dir / "keep.txt"));
}

TEST_F(PlatformOpsFixture, ClearRemovesContentsKeepsDirectory) {
    fs::create_directories(root / "sub" / "deeper");
    std::ofstream(root / "A.class") << "x";
    std::ofstream(root / "sub" / "B.class") << "y";
    std::ofstream(root / "sub" / "deeper" / "C.class") << "z";
    ops->clear_directory(root.string());
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(PlatformOpsFixture, ClearMissingDirectoryIsFine) {
    ops->clear_directory((root / "missing").string());
    EXPECT_FALSE(fs::exists(root / "missing"));
}

#ifndef _WIN32
TEST(PosixPlatformOps, SignalsToInvalidPidFail) {
    PosixPlatformOps ops;
    EXPECT_FALSE(ops.interrupt(-1));
    EXPECT_FALSE(ops.interrupt(0));
    EXPECT_FALSE(ops.force_kill(0));
}
#endif
