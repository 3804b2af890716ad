/*
 * Valheim Server Manager — log tailer tests
 * (c) 2025 ValheimServerManager contributors
 */
#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>

#include <unistd.h>

#include "TestUtil.hpp"
#include "include/LogTailer.hpp"

using namespace vsm;
using vsm::test::TempDir;
using vsm::test::ManualClock;
using vsm::test::writeFile;
using vsm::test::appendFile;

namespace {

struct TailFixture : ::testing::Test {
    TempDir dir;
    ManualClock clock;
    std::string path = dir.file("server.log");
    std::vector<std::string> lines;
    std::vector<LogEvent> events;

    std::unique_ptr<LogTailer> make(LogTailer::EventParser parser = {}) {
        auto t = std::make_unique<LogTailer>(clock.sched(), path, std::move(parser));
        t->onLine().subscribe([this](const std::string& l) { lines.push_back(l); });
        t->onEvent().subscribe([this](const LogEvent& e) { events.push_back(e); });
        return t;
    }
};

} // namespace

TEST_F(TailFixture, FromStartDeliversExistingLines) {
    writeFile(path, "one\ntwo\n");
    auto t = make();
    t->start(false);
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(t->cursor().byteOffset, 8u);
    EXPECT_TRUE(t->cursor().running);
}

TEST_F(TailFixture, FromEndSkipsExistingContent) {
    writeFile(path, "old\n");
    auto t = make();
    t->start(true);
    t->poll();
    EXPECT_TRUE(lines.empty());
    appendFile(path, "new\n");
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"new"}));
}

TEST_F(TailFixture, PollsOnTheScheduler) {
    writeFile(path, "");
    auto t = make();
    t->start(false);
    appendFile(path, "tick\n");
    clock.advance(LogTailer::kDefaultPollIntervalMs - 100);
    EXPECT_TRUE(lines.empty());
    clock.advance(100);
    EXPECT_EQ(lines, (std::vector<std::string>{"tick"}));

    t->stop();
    appendFile(path, "after stop\n");
    clock.advance(2000);
    EXPECT_EQ(lines.size(), 1u);
    EXPECT_EQ(clock.sched().size(), 0u);
}

TEST_F(TailFixture, PartialLineWaitsForNewline) {
    writeFile(path, "");
    auto t = make();
    t->start(false);
    appendFile(path, "Got char");
    t->poll();
    EXPECT_TRUE(lines.empty());
    appendFile(path, "acter\n\n   \nnext\n");
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"Got character", "next"}));
}

TEST_F(TailFixture, TruncationRewindsToStart) {
    writeFile(path, "a long first line\nand another\n");
    auto t = make();
    t->start(true);
    writeFile(path, "fresh\n");
    t->poll(); // notices the shrink
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"fresh"}));
}

TEST_F(TailFixture, RotationReopensNewFile) {
    writeFile(path, "before\n");
    auto t = make();
    t->start(false);
    t->poll();
    std::filesystem::rename(path, path + ".1");
    writeFile(path, "after\n");
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"before", "after"}));
}

TEST_F(TailFixture, LateCreatedFileIsReadFromStart) {
    auto t = make();
    t->start(true);
    EXPECT_FALSE(t->hasHandle());
    t->poll();
    EXPECT_TRUE(lines.empty());
    writeFile(path, "hello\n");
    t->poll();
    EXPECT_TRUE(t->hasHandle());
    EXPECT_EQ(lines, (std::vector<std::string>{"hello"}));
}

TEST_F(TailFixture, ParserEventsFollowLines) {
    writeFile(path, "");
    auto t = make(parseServerEvent);
    t->start(false);
    appendFile(path, "02/15/2024 12:00:00: Got character ZDOID from Ragnar : -123:1\nnoise\n");
    t->poll();
    EXPECT_EQ(lines.size(), 2u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, LogEventType::PlayerJoin);
    EXPECT_EQ(events[0].name, "Ragnar");
}

TEST_F(TailFixture, StopFromSubscriberDropsRemainder) {
    writeFile(path, "");
    auto t = make();
    LogTailer* raw = t.get();
    t->onLine().subscribe([raw](const std::string& l) {
        if (l == "stop") raw->stop();
    });
    t->start(false);
    appendFile(path, "a\nstop\nb\n");
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "stop"}));
    EXPECT_FALSE(t->running());
}

TEST_F(TailFixture, SetPathRestartsFromEndOfNewFile) {
    writeFile(path, "");
    const std::string other = dir.file("other.log");
    writeFile(other, "existing\n");
    auto t = make();
    t->start(false);
    t->setPath(other);
    EXPECT_TRUE(t->running());
    EXPECT_EQ(t->path(), other);
    appendFile(other, "appended\n");
    t->poll();
    EXPECT_EQ(lines, (std::vector<std::string>{"appended"}));
}

TEST(LogTailerLastLines, ReturnsTailSkippingBlanks) {
    TempDir dir;
    const std::string p = dir.file("x.log");
    writeFile(p, "1\n2\n\n3\n4\n5\n");
    EXPECT_EQ(LogTailer::readLastLines(p, 3), (std::vector<std::string>{"3", "4", "5"}));
    EXPECT_EQ(LogTailer::readLastLines(p, 50).size(), 5u);
    EXPECT_TRUE(LogTailer::readLastLines(p, 0).empty());
    EXPECT_TRUE(LogTailer::readLastLines(dir.file("missing.log"), 10).empty());
}

TEST(LogTailerLastLines, SpansMultipleChunks) {
    TempDir dir;
    const std::string p = dir.file("big.log");
    std::string content;
    for (int i = 0; i < 5000; ++i) content += "line number " + std::to_string(i) + "\n";
    writeFile(p, content);
    const auto last = LogTailer::readLastLines(p, 2000);
    ASSERT_EQ(last.size(), 2000u);
    EXPECT_EQ(last.front(), "line number 3000");
    EXPECT_EQ(last.back(), "line number 4999");
}
