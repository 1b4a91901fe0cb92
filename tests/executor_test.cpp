/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/executor.hpp"
#include "volbatch/console.hpp"
#include "volbatch/registry.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <thread>

namespace volbatch {

namespace {

using volbatch::testing::TempDir;
using volbatch::testing::readFile;
using volbatch::testing::waitUntil;
using volbatch::testing::writeFakeTool;
using volbatch::testing::writeFile;

TEST(ExecutorPathTest, ImageBaseNameIsLastPathComponent) {
    EXPECT_EQ(Executor::imageBaseName("/cases/42/mem.raw"), "mem.raw");
    EXPECT_EQ(Executor::imageBaseName("mem.raw"), "mem.raw");
    EXPECT_EQ(Executor::imageBaseName("relative/dir/host.vmem"), "host.vmem");
}

TEST(ExecutorPathTest, OutputPathCombinesDirImageAndJob) {
    EXPECT_EQ(Executor::outputPathFor("/out", "/cases/mem.raw", "pslist"),
              std::filesystem::path("/out/mem.raw_pslist.csv"));
    EXPECT_EQ(Executor::outputPathFor("/out", "/cases/mem.raw", "windows.netscan"),
              std::filesystem::path("/out/mem.raw_windows.netscan.csv"));
}

class ExecutorTest : public ::testing::Test {
protected:
    ExecutorConfig config(const std::string& sleepSeconds = "0") {
        auto tool = writeFakeTool(dir_.path(), sleepSeconds);
        std::filesystem::create_directories(dir_.path() / "out");
        return ExecutorConfig{tool.string(), "/cases/mem.raw", dir_.path() / "out"};
    }

    TempDir dir_;
    RunRegistry registry_;
    std::ostringstream text_;
    Console console_{text_};
};

TEST_F(ExecutorTest, SuccessWritesToolStdoutToOutputFile) {
    Executor executor(config(), registry_, console_);
    auto outcome = executor.run("pslist");

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.error, JobError::None);
    EXPECT_EQ(outcome.outputPath, dir_.path() / "out" / "mem.raw_pslist.csv");
    EXPECT_EQ(readFile(outcome.outputPath), "-f,/cases/mem.raw,-r,csv,pslist\n");
    EXPECT_GE(outcome.elapsedSeconds, 0.0);
    EXPECT_TRUE(registry_.empty());

    auto console = text_.str();
    EXPECT_NE(console.find("Running job: pslist"), std::string::npos);
    EXPECT_NE(console.find("Job pslist completed in"), std::string::npos);
}

TEST_F(ExecutorTest, NonZeroExitIsFailureAndDeregisters) {
    Executor executor(config(), registry_, console_);
    auto outcome = executor.run("badmodule");

    EXPECT_EQ(outcome.status, Status::Failed);
    EXPECT_EQ(outcome.error, JobError::ExitStatus);
    EXPECT_EQ(outcome.message, "exit status 3");
    EXPECT_EQ(readFile(outcome.outputPath), "partial\n");
    EXPECT_TRUE(registry_.empty());
    EXPECT_NE(text_.str().find("!--- Error running job badmodule"), std::string::npos);
}

TEST_F(ExecutorTest, KilledToolIsFailure) {
    Executor executor(config(), registry_, console_);
    auto outcome = executor.run("crash");

    EXPECT_EQ(outcome.status, Status::Failed);
    EXPECT_EQ(outcome.error, JobError::Signaled);
    EXPECT_TRUE(registry_.empty());
}

TEST_F(ExecutorTest, MissingToolIsLaunchFailure) {
    auto cfg = config();
    cfg.toolPath = (dir_.path() / "missing-vol").string();
    Executor executor(cfg, registry_, console_);
    auto outcome = executor.run("pslist");

    EXPECT_EQ(outcome.status, Status::Failed);
    EXPECT_EQ(outcome.error, JobError::Launch);
    EXPECT_TRUE(registry_.empty());
}

TEST_F(ExecutorTest, UnopenableOutputSkipsJobWithoutRunningIt) {
    auto cfg = config();
    cfg.outputDir = dir_.path() / "does" / "not" / "exist";
    Executor executor(cfg, registry_, console_);
    auto outcome = executor.run("pslist");

    EXPECT_EQ(outcome.status, Status::Skipped);
    EXPECT_EQ(outcome.error, JobError::OutputOpen);
    EXPECT_FALSE(outcome.message.empty());
    EXPECT_TRUE(registry_.empty());
    auto console = text_.str();
    EXPECT_NE(console.find("Error creating output file for job pslist"), std::string::npos);
    EXPECT_EQ(console.find("Running job: pslist"), std::string::npos);
}

TEST_F(ExecutorTest, RerunOverwritesPreviousOutput) {
    auto cfg = config();
    auto path = Executor::outputPathFor(cfg.outputDir, cfg.imagePath, "pstree");
    writeFile(path, std::string(4096, 'x'));

    Executor executor(cfg, registry_, console_);
    ASSERT_TRUE(executor.run("pstree").succeeded());
    ASSERT_TRUE(executor.run("pstree").succeeded());

    EXPECT_EQ(readFile(path), "-f,/cases/mem.raw,-r,csv,pstree\n");
    std::size_t csvFiles = 0;
    for (const auto& entry : std::filesystem::directory_iterator(cfg.outputDir)) {
        if (entry.path().extension() == ".csv") ++csvFiles;
    }
    EXPECT_EQ(csvFiles, 1u);
}

TEST_F(ExecutorTest, JobIsRegisteredOnlyWhileRunning) {
    Executor executor(config("0.5"), registry_, console_);
    JobOutcome outcome;
    std::thread worker([&] { outcome = executor.run("netscan"); });

    ASSERT_TRUE(waitUntil([&] { return registry_.size() == 1; }));
    auto entries = registry_.snapshot();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "netscan");

    worker.join();
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_TRUE(registry_.empty());
}

}

}
