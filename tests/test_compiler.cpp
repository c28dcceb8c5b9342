#include <gtest/gtest.h>
#include <jdkrun/build/compiler.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace jdkrun;
using namespace jdkrun::test;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    auto p = fs::temp_directory_path() / ("jdkrun_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(p);
    return p;
}

std::vector<std::string> names_in(const fs::path& dir) {
    std::vector<std::string> out;
    for (auto &e : fs::directory_iterator(dir)) out.push_back(e.path().filename().string());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

TEST(CompilerGateway, EmptyFileListTouchesNothing) {
    FakeCompiler javac; PosixPlatformOps ops; RecordingSink sink;
    CompilerGateway gw(javac, ops, sink);
    auto out = scratch_dir("empty");
    auto r = gw.compile({}, out.string());
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_TRUE(sink.events().empty());
    EXPECT_TRUE(javac.calls.empty());
}

TEST(CompilerGateway, SuccessLeavesOnlyFreshArtifacts) {
    FakeCompiler javac; PosixPlatformOps ops; RecordingSink sink;
    CompilerGateway gw(javac, ops, sink);
    auto out = scratch_dir("fresh");
    ASSERT_TRUE(gw.compile({"/src/Old.java"}, out.string()).ok);
    fs::create_directories(out / "pkg");
    std::ofstream(out / "pkg" / "Stale.class") << "x";

    auto r = gw.compile({"/src/Main.java", "/src/Helper.java"}, out.string());
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_EQ(names_in(out), (std::vector<std::string>{"Helper.class", "Main.class"}));
    fs::remove_all(out);
}

TEST(CompilerGateway, LogsCompilingThenDone) {
    FakeCompiler javac; PosixPlatformOps ops; RecordingSink sink;
    CompilerGateway gw(javac, ops, sink);
    auto out = scratch_dir("logs");
    ASSERT_TRUE(gw.compile({"/src/Main.java"}, out.string()).ok);
    auto evs = sink.events();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(evs[0].kind, EventKind::Log); EXPECT_EQ(evs[0].payload, "Compiling...");
    EXPECT_EQ(evs[1].kind, EventKind::Log); EXPECT_EQ(evs[1].payload, "Done.");
    ASSERT_EQ(javac.calls.size(), 1u);
    EXPECT_EQ(javac.calls[0], (std::vector<std::string>{"/src/Main.java"}));
    fs::remove_all(out);
}

TEST(CompilerGateway, FailureEmitsDiagnosticsVerbatim) {
    FakeCompiler javac; javac.exit_code = 1;
    javac.diagnostics = "Main.java:3: error: ';' expected\n        int x = 1\n                 ^\n1 error\n";
    PosixPlatformOps ops; RecordingSink sink;
    CompilerGateway gw(javac, ops, sink);
    auto out = scratch_dir("fail");
    auto r = gw.compile({"/src/Main.java"}, out.string());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostics, javac.diagnostics);
    EXPECT_EQ(sink.joined(EventKind::Error), javac.diagnostics);
    EXPECT_EQ(sink.count(EventKind::Log, "Done."), 0u);
    EXPECT_TRUE(fs::is_directory(out)); // prepared even though compile failed
    fs::remove_all(out);
}

TEST(CompilerGateway, ExistingOutputDirIsNotAnError) {
    FakeCompiler javac; PosixPlatformOps ops; RecordingSink sink;
    CompilerGateway gw(javac, ops, sink);
    auto out = scratch_dir("exists");
    fs::create_directories(out);
    EXPECT_TRUE(gw.compile({"/src/A.java"}, out.string()).ok);
    EXPECT_TRUE(sink.joined(EventKind::Error).empty());
    fs::remove_all(out);
}

TEST(ExternalCompiler, CommandLineLayout) {
    ExternalCompiler javac("javac", {"-g", "-encoding", "UTF-8"});
    auto argv = javac.command_line({"/a/Main.java", "/a/B.java"}, "/out dir");
    EXPECT_EQ(argv, (std::vector<std::string>{"javac", "-g", "-encoding", "UTF-8", "/a/Main.java", "/a/B.java", "-d", "/out dir"}));
}

TEST(ExternalCompiler, NonZeroExitCarriesStderr) {
    // ls of a missing path fails with a message on stderr; "-d <dir>" is accepted by ls
    ExternalCompiler fake_javac("/bin/ls");
    auto r = fake_javac.invoke({"/nonexistent_jdkrun_source.java"}, "/tmp");
    EXPECT_NE(r.exit_code, 0);
    EXPECT_NE(r.diagnostics.find("nonexistent_jdkrun_source"), std::string::npos);
}

TEST(ExternalCompiler, ZeroExitIsSuccess) {
    ExternalCompiler fake_javac("true");
    auto r = fake_javac.invoke({"/x/Main.java"}, "/tmp");
    EXPECT_EQ(r.exit_code, 0);
}
