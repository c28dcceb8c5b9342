#include <gtest/gtest.h>
#include <jdkrun/sink/console_sink.hpp>
#include <sstream>

using namespace jdkrun;

TEST(ConsoleSink, RoutesKindsWithoutColor) {
    std::ostringstream out, err;
    ConsoleSink sink(out, err, false);
    sink.log("Compiling...");
    sink.output("partial");
    sink.output(" line\n");
    sink.error("Exception in thread \"main\"\n");
    EXPECT_EQ(out.str(), "partial line\n");
    EXPECT_EQ(err.str(), "[jdkrun] Compiling...\nException in thread \"main\"\n");
}

TEST(ConsoleSink, ColorsErrorsAndLogsOnly) {
    std::ostringstream out, err;
    ConsoleSink sink(out, err, true);
    sink.output("plain");
    sink.error("bad");
    sink.log("Done.");
    EXPECT_EQ(out.str(), "plain");
    EXPECT_EQ(err.str(), "\x1b[31mbad\x1b[0m\x1b[36m[jdkrun] Done.\x1b[0m\n");
}
