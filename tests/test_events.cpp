#include <gtest/gtest.h>
#include <jdkrun/core/event.hpp>
#include "test_support.hpp"

using namespace jdkrun;
using namespace jdkrun::test;

TEST(Events, KindNames) {
    EXPECT_STREQ(kind_name(EventKind::Log), "log");
    EXPECT_STREQ(kind_name(EventKind::Output), "output");
    EXPECT_STREQ(kind_name(EventKind::Error), "error");
}

TEST(Events, EscapeJson) {
    EXPECT_EQ(escape_json("plain"), "plain");
    EXPECT_EQ(escape_json("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(escape_json("l1\nl2\r\t"), "l1\\nl2\\r\\t");
    EXPECT_EQ(escape_json(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escape_json("caff\xc3\xa8"), "caff\xc3\xa8"); // UTF-8 passes through
}

TEST(Events, EscapeJsonInvalidUtf8) {
    EXPECT_EQ(escape_json("\xff"), "\\u00ff");
    EXPECT_EQ(escape_json("caff\xc3"), "caff\\u00c3");              // truncated sequence
    EXPECT_EQ(escape_json("\xc0\xaf"), "\\u00c0\\u00af");         // overlong '/'
    EXPECT_EQ(escape_json("\xed\xa0\x80"), "\\u00ed\\u00a0\\u0080"); // surrogate
    EXPECT_EQ(escape_json("\xf0\x9f\x98\x80!"), "\xf0\x9f\x98\x80!");  // 4-byte sequence kept
    EXPECT_EQ(to_json(Event{EventKind::Output, "a\x80" "b"}),
              "{\"domain\":\"jdkrun\",\"event\":\"output\",\"payload\":\"a\\u0080b\"}");
}

TEST(Events, ToJsonShape) {
    EXPECT_EQ(to_json(Event{EventKind::Output, "hi\n"}),
              "{\"domain\":\"jdkrun\",\"event\":\"output\",\"payload\":\"hi\\n\"}");
    EXPECT_EQ(to_json(Event{EventKind::Log, "Compiling..."}),
              "{\"domain\":\"jdkrun\",\"event\":\"log\",\"payload\":\"Compiling...\"}");
}

TEST(Events, HelpersSetKind) {
    RecordingSink sink;
    sink.log("l"); sink.output("o"); sink.error("e");
    auto evs = sink.events();
    ASSERT_EQ(evs.size(), 3u);
    EXPECT_EQ(evs[0].kind, EventKind::Log);
    EXPECT_EQ(evs[1].kind, EventKind::Output);
    EXPECT_EQ(evs[2].kind, EventKind::Error);
}

TEST(Events, FanoutReachesEverySinkInOrder) {
    RecordingSink a, b;
    FanoutSink fan;
    fan.add(&a); fan.add(nullptr); fan.add(&b);
    fan.output("x"); fan.error("y");
    EXPECT_EQ(a.joined(EventKind::Output), "x");
    EXPECT_EQ(b.joined(EventKind::Output), "x");
    EXPECT_EQ(a.joined(EventKind::Error), "y");
    EXPECT_EQ(b.events().size(), 2u);
}

TEST(Events, CallbackSink) {
    std::string seen;
    CallbackSink cb([&](const Event& ev){ seen += kind_name(ev.kind); seen += ":" + ev.payload + ";"; });
    cb.log("a"); cb.output("b");
    EXPECT_EQ(seen, "log:a;output:b;");
    CallbackSink empty(nullptr);
    empty.log("ignored"); // no callback, no crash
}
