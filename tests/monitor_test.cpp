/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/monitor.hpp"
#include "volbatch/console.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <unistd.h>

namespace volbatch {

namespace {

using volbatch::testing::waitUntil;

std::size_t countOf(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

TEST(StatusMonitorRenderTest, EmptySnapshotHasOnlyHeaderAndFooter) {
    auto text = StatusMonitor::render({}, Clock::now());
    EXPECT_EQ(text, "\n---- Currently running jobs ----\n---- End ----\n\n");
}

TEST(StatusMonitorRenderTest, OneLinePerJobWithElapsedSeconds) {
    auto now = Clock::now();
    std::vector<RunEntry> entries{
        {"pslist", now - std::chrono::milliseconds(2500)},
        {"netscan", now - std::chrono::seconds(61)},
    };
    auto text = StatusMonitor::render(entries, now);
    EXPECT_NE(text.find("pslist, 2.50 seconds\n"), std::string::npos);
    EXPECT_NE(text.find("netscan, 61.00 seconds\n"), std::string::npos);
}

class StatusMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds_), 0);
    }
    void TearDown() override {
        closeWriteEnd();
        if (fds_[0] >= 0) ::close(fds_[0]);
    }
    void press(const std::string& keys) {
        ASSERT_EQ(::write(fds_[1], keys.data(), keys.size()), static_cast<ssize_t>(keys.size()));
    }
    void closeWriteEnd() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

    int fds_[2] = {-1, -1};
    RunRegistry registry_;
    std::ostringstream text_;
    Console console_{text_};
};

TEST_F(StatusMonitorTest, EachLinePrintsOneSnapshot) {
    registry_.record("pslist", Clock::now() - std::chrono::seconds(3));
    registry_.record("pstree", Clock::now());

    StatusMonitor monitor(registry_, console_, fds_[0]);
    ASSERT_TRUE(monitor.start());
    press("\n");
    press("ignored text\n");
    closeWriteEnd();

    // End of input stops the listener after the pending lines are handled
    ASSERT_TRUE(waitUntil([&] { return !monitor.isRunning(); }));
    monitor.stop();

    auto text = text_.str();
    EXPECT_EQ(countOf(text, "---- Currently running jobs ----"), 2u);
    EXPECT_EQ(countOf(text, "---- End ----"), 2u);
    EXPECT_EQ(countOf(text, "pslist, 3."), 2u);
    EXPECT_EQ(countOf(text, "pstree, 0."), 2u);
}

TEST_F(StatusMonitorTest, EmptyRegistryPrintsEmptySnapshot) {
    StatusMonitor monitor(registry_, console_, fds_[0]);
    ASSERT_TRUE(monitor.start());
    press("\n");
    closeWriteEnd();
    ASSERT_TRUE(waitUntil([&] { return !monitor.isRunning(); }));
    monitor.stop();

    EXPECT_EQ(text_.str(), "\n---- Currently running jobs ----\n---- End ----\n\n");
}

TEST_F(StatusMonitorTest, KeyWithoutNewlineStillPrints) {
    registry_.record("malfind", Clock::now());
    StatusMonitor monitor(registry_, console_, fds_[0]);
    ASSERT_TRUE(monitor.start());
    press("x");
    closeWriteEnd();
    ASSERT_TRUE(waitUntil([&] { return !monitor.isRunning(); }));
    monitor.stop();

    auto text = text_.str();
    EXPECT_EQ(countOf(text, "---- Currently running jobs ----"), 1u);
    EXPECT_EQ(countOf(text, "malfind, "), 1u);
}

TEST_F(StatusMonitorTest, StopReturnsWhileInputStaysOpen) {
    StatusMonitor monitor(registry_, console_, fds_[0]);
    ASSERT_TRUE(monitor.start());
    EXPECT_FALSE(monitor.start());

    auto begin = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
    EXPECT_FALSE(monitor.isRunning());
    EXPECT_TRUE(text_.str().empty());
}

}

}
