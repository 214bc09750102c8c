#include <limits>
#include <signal.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "process/executor.hpp"
#include "process/subprocess.hpp"
#include "test/sandbox_test.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::process;
using namespace sandbox::test;

class ExecutorTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        ignore_sigpipe();
    }

    command_run_result run(const string &command, optional<string> stdin_data = {}, double timeout = 10) {
        command_options options;
        options.command = command;
        options.workdir = dir.path();
        options.stdin_data = move(stdin_data);
        options.timeout = chrono::duration<double>(timeout);
        return run_command(options);
    }

    pid_t read_pid(const string &filename) {
        return boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(read_file_content(dir.path() / filename)));
    }

    temp_directory dir;
};

TEST_F(ExecutorTest, EchoTest) {
    auto result = run("echo hello; echo world >&2; exit 3");
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_EQ(result.return_code, 3);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "world\n");
    EXPECT_GT(result.execution_time, 0);
}

TEST_F(ExecutorTest, WorkdirTest) {
    auto result = run("pwd -P");
    EXPECT_EQ(result.stdout_data, filesystem::canonical(dir.path()).string() + "\n");
}

TEST_F(ExecutorTest, EnvTest) {
    command_options options;
    options.command = "echo $SANDBOX_TEST_VALUE";
    options.workdir = dir.path();
    options.env["SANDBOX_TEST_VALUE"] = "42";
    auto result = run_command(options);
    EXPECT_EQ(result.stdout_data, "42\n");
}

TEST_F(ExecutorTest, LargeOutputTest) {
    // stdout 和 stderr 同时写满管道也不会死锁
    auto result = run("head -c 1000000 /dev/zero | tr '\\0' a; head -c 1000000 /dev/zero | tr '\\0' b >&2");
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_EQ(result.return_code, 0);
    EXPECT_EQ(result.stdout_data, string(1000000, 'a'));
    EXPECT_EQ(result.stderr_data, string(1000000, 'b'));
}

TEST_F(ExecutorTest, StdinTest) {
    auto result = run("cat", "hello\nworld");
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_EQ(result.stdout_data, "hello\nworld");
}

TEST_F(ExecutorTest, LargeStdinTest) {
    string payload(4 * 1024 * 1024, 'x');
    auto result = run("cat", payload);
    EXPECT_EQ(result.return_code, 0);
    EXPECT_EQ(result.stdout_data.size(), payload.size());
}

TEST_F(ExecutorTest, NoStdinTest) {
    // 没有 stdin 时读到的是 /dev/null
    auto result = run("cat; echo done");
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_EQ(result.stdout_data, "done\n");
}

TEST_F(ExecutorTest, ExitBeforeReadingStdinTest) {
    for (int i = 0; i < 20; ++i) {
        auto result = run("exit 0", string(1024 * 1024, 'x'));
        EXPECT_EQ(result.status, command_run_status::FINISHED);
        EXPECT_EQ(result.return_code, 0);
    }
}

TEST_F(ExecutorTest, KilledBySignalTest) {
    auto result = run("kill -9 $$");
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_EQ(result.return_code, 128 + SIGKILL);
}

TEST_F(ExecutorTest, TimeoutTest) {
    elapsed_time timer;
    auto result = run("sleep 30 & echo $! > child.pid; echo started; sleep 30", {}, 0.5);
    EXPECT_LT(timer.seconds(), 5);
    EXPECT_EQ(result.status, command_run_status::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(result.return_code);
    EXPECT_EQ(result.stdout_data, "started\n");
    EXPECT_TRUE(wait_process_gone(read_pid("child.pid"), chrono::seconds(2)));
}

TEST_F(ExecutorTest, BackgroundChildKilledOnExitTest) {
    // 根进程正常退出，后台进程也必须被杀死
    auto result = run("sleep 30 & echo $! > child.pid; exit 0");
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_EQ(result.return_code, 0);
    EXPECT_TRUE(wait_process_gone(read_pid("child.pid"), chrono::seconds(2)));
}

TEST_F(ExecutorTest, NestedChildrenKilledOnTimeoutTest) {
    auto result = run("bash -c 'bash -c \"sleep 30 & echo \\$! > deep.pid; wait\" & wait' & wait", {}, 0.5);
    EXPECT_EQ(result.status, command_run_status::TIME_LIMIT_EXCEEDED);
    EXPECT_TRUE(wait_process_gone(read_pid("deep.pid"), chrono::seconds(2)));
}

TEST_F(ExecutorTest, SpawnFailureTest) {
    command_options options;
    options.command = "echo unreachable";
    options.workdir = dir.path() / "missing";
    auto result = run_command(options);
    EXPECT_EQ(result.status, command_run_status::ERROR);
    EXPECT_FALSE(result.return_code);
    EXPECT_NE(result.stderr_data.find("failed to start command"), string::npos);
}

TEST_F(ExecutorTest, MemoryLimitTest) {
    command_options options;
    options.command = "x=$(head -c 300000000 /dev/zero | tr '\\0' a); echo ${#x}";
    options.workdir = dir.path();
    options.memory_limit = 64 * 1024 * 1024;
    auto result = run_command(options);
    EXPECT_EQ(result.status, command_run_status::FINISHED);
    EXPECT_NE(result.return_code, 0);
    EXPECT_NE(result.stdout_data, "300000000\n");
}

TEST(DeadlineTest, BoundedDeadlineTest) {
    auto now = clock_type::now();
    EXPECT_GE(deadline_after(chrono::duration<double>(1e20)), now + MAX_TIMEOUT);
    EXPECT_LE(deadline_after(chrono::duration<double>(1e20)), clock_type::now() + MAX_TIMEOUT);
    EXPECT_LE(deadline_after(chrono::duration<double>(-5)), clock_type::now());
    EXPECT_LE(deadline_after(chrono::duration<double>(numeric_limits<double>::quiet_NaN())), clock_type::now());
    EXPECT_GT(deadline_after(chrono::duration<double>(1)), now);
}
