#include <gtest/gtest.h>
#include "utils/SubProcess.hpp"
#include <chrono>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <stdexcept>

using namespace code_interpreter;
using namespace std::chrono_literals;

namespace {
bool have(const char* path) { return std::filesystem::exists(path); }
}

TEST(SubProcessTest, RejectsRelativeExecutable) {
    SpawnRequest req;
    req.argv = {"sh", "-c", "true"};
    EXPECT_THROW(SubProcess::run(req), std::invalid_argument);

    SpawnRequest empty;
    EXPECT_THROW(SubProcess::run(empty), std::invalid_argument);
}

TEST(SubProcessTest, CapturesBothStreamsAndExitCode) {
    if (!have("/bin/sh")) GTEST_SKIP() << "/bin/sh not available";

    SpawnRequest req;
    req.argv = {"/bin/sh", "-c", "echo out; echo err >&2; exit 3"};
    ProcessResult r = SubProcess::run(req);

    EXPECT_TRUE(r.reaped);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_text, "out\n");
    EXPECT_EQ(r.stderr_text, "err\n");
    EXPECT_FALSE(r.success());
}

TEST(SubProcessTest, ChildStartsWithEmptyEnvironment) {
    if (!have("/usr/bin/env")) GTEST_SKIP() << "/usr/bin/env not available";

    SpawnRequest req;
    req.argv = {"/usr/bin/env"};
    ProcessResult r = SubProcess::run(req);

    EXPECT_TRUE(r.success());
    EXPECT_EQ(r.stdout_text, "");
}

TEST(SubProcessTest, PassesExplicitEnvironment) {
    if (!have("/usr/bin/env")) GTEST_SKIP() << "/usr/bin/env not available";

    SpawnRequest req;
    req.argv = {"/usr/bin/env"};
    req.env = {"ONLY_VAR=1"};
    ProcessResult r = SubProcess::run(req);

    EXPECT_EQ(r.stdout_text, "ONLY_VAR=1\n");
}

TEST(SubProcessTest, TimeoutKillsAndReaps) {
    if (!have("/bin/sh")) GTEST_SKIP() << "/bin/sh not available";

    SpawnRequest req;
    req.argv = {"/bin/sh", "-c", "sleep 10"};
    req.env = {"PATH=/usr/bin:/bin"};
    req.timeout = 300ms;

    auto start = std::chrono::steady_clock::now();
    ProcessResult r = SubProcess::run(req);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.timed_out);
    EXPECT_TRUE(r.reaped);
    EXPECT_EQ(r.term_signal, SIGKILL);
    EXPECT_LT(elapsed, 5s);
}

TEST(SubProcessTest, MissingExecutableReportsExecFailure) {
    SpawnRequest req;
    req.argv = {"/nonexistent/definitely_not_here"};
    ProcessResult r = SubProcess::run(req);

    EXPECT_TRUE(r.exec_failed);
    EXPECT_EQ(r.exec_errno, ENOENT);
    EXPECT_TRUE(r.reaped);
    EXPECT_EQ(r.stderr_text, "");
    EXPECT_FALSE(r.success());
}

TEST(SubProcessTest, BadWorkingDirectoryReportsExecFailure) {
    if (!have("/bin/pwd")) GTEST_SKIP() << "/bin/pwd not available";

    SpawnRequest req;
    req.argv = {"/bin/pwd"};
    req.working_directory = "/nonexistent/dir";
    ProcessResult r = SubProcess::run(req);

    EXPECT_TRUE(r.exec_failed);
    EXPECT_EQ(r.exec_errno, ENOENT);
    EXPECT_EQ(r.stdout_text, "");
}

TEST(SubProcessTest, ChildExitingWith127IsNotAnExecFailure) {
    if (!have("/bin/sh")) GTEST_SKIP() << "/bin/sh not available";

    SpawnRequest req;
    req.argv = {"/bin/sh", "-c", "echo 'exec failed: fake' >&2; exit 127"};
    ProcessResult r = SubProcess::run(req);

    EXPECT_FALSE(r.exec_failed);
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_EQ(r.stderr_text, "exec failed: fake\n");
}

TEST(SubProcessTest, RejectsNulInsideAnArgument) {
    SpawnRequest req;
    req.argv = {"/bin/sh", "-c", std::string("true\0false", 10)};
    EXPECT_THROW(SubProcess::run(req), std::invalid_argument);
}

TEST(SubProcessTest, EndlessOutputIsCappedAndDrained) {
    if (!have("/usr/bin/yes")) GTEST_SKIP() << "/usr/bin/yes not available";

    SpawnRequest req;
    req.argv = {"/usr/bin/yes", "spam"};
    req.timeout = 1500ms;
    req.max_capture_bytes = 10001;

    auto start = std::chrono::steady_clock::now();
    ProcessResult r = SubProcess::run(req);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.timed_out);
    EXPECT_TRUE(r.reaped);
    EXPECT_TRUE(r.stdout_clipped);
    EXPECT_EQ(r.stdout_text.size(), 10001u);
    EXPECT_EQ(r.stdout_text.rfind("spam\nspam\n", 0), 0u);
    EXPECT_LT(elapsed, 5s);
}

TEST(SubProcessTest, OutputUnderTheCapIsNotClipped) {
    if (!have("/bin/sh")) GTEST_SKIP() << "/bin/sh not available";

    SpawnRequest req;
    req.argv = {"/bin/sh", "-c", "echo hello"};
    req.max_capture_bytes = 6;
    ProcessResult r = SubProcess::run(req);

    EXPECT_FALSE(r.stdout_clipped);
    EXPECT_EQ(r.stdout_text, "hello\n");
}

TEST(SubProcessTest, RunsInWorkingDirectory) {
    if (!have("/bin/pwd")) GTEST_SKIP() << "/bin/pwd not available";

    SpawnRequest req;
    req.argv = {"/bin/pwd"};
    req.working_directory = "/";
    ProcessResult r = SubProcess::run(req);

    EXPECT_EQ(r.stdout_text, "/\n");
}
