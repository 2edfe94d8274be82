#include <signal.h>
#include <sys/wait.h>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "grader/process.hpp"
#include "grader/runner.hpp"
#include "gtest/gtest.h"
#include "test/helpers.hpp"

using namespace std;
using namespace std::chrono;
using namespace std::filesystem;
using namespace bayview;

static executable_artifact shell(const string &script) {
    return {{"/bin/sh", "-c", script}, test_run_dir()};
}

TEST(RunnerTest, EchoTest) {
    process_runner runner;
    auto result = runner.run({{"cat"}, test_run_dir()}, "hello world\n", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.output, "hello world\n");
    EXPECT_EQ(result.exit_code, 0);
}

TEST(RunnerTest, LargePayloadTest) {
    // 输入输出都远大于管道缓冲区
    string input;
    input.reserve(8 << 20);
    while (input.size() < (8u << 20)) input += "0123456789abcdefghijklmnopqrstuvwxyz\n";

    process_runner runner;
    auto result = runner.run({{"cat"}, test_run_dir()}, input, seconds(10));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.output.size(), input.size());
    EXPECT_TRUE(result.output == input);
}

TEST(RunnerTest, IgnoreInputTest) {
    // 程序不读取 stdin 直接退出，写入 stdin 时得到 EPIPE
    string input(1 << 20, 'x');
    process_runner runner;
    auto result = runner.run(shell("echo done"), input, seconds(2));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.output, "done\n");
}

TEST(RunnerTest, TimeLimitTest) {
    process_runner runner;
    auto start = steady_clock::now();
    auto result = runner.run(shell("echo partial; sleep 10"), "", seconds(1));
    auto elapsed = steady_clock::now() - start;
    EXPECT_EQ(result.outcome, execution_outcome::TIMED_OUT);
    EXPECT_TRUE(result.output.empty());
    EXPECT_GE(result.elapsed, milliseconds(1000));
    EXPECT_LT(elapsed, seconds(3));
}

TEST(RunnerTest, InfiniteLoopTest) {
    process_runner runner;
    auto result = runner.run(shell("while :; do :; done"), "", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::TIMED_OUT);
}

TEST(RunnerTest, KillDescendantsTest) {
    path pid_file = test_run_dir() / "descendant.pid";
    process_runner runner;
    auto result = runner.run(shell("sleep 30 & echo $! > " + pid_file.string() + "; wait"), "", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::TIMED_OUT);

    pid_t pid = stoi(read_file_content(pid_file));
    remove(pid_file);
    // 后代进程已经被杀死，由 init 回收后不再存在
    bool alive = true;
    for (int i = 0; i < 100 && alive; ++i) {
        string state = read_file_content("/proc/" + to_string(pid) + "/stat", "");
        alive = !state.empty() && state.find(") Z") == string::npos;
        if (alive) this_thread::sleep_for(milliseconds(10));
    }
    EXPECT_FALSE(alive);
}

TEST(RunnerTest, ExitKillsBackgroundTest) {
    // 选手程序退出后，后台进程持有的输出管道不会阻塞评测
    process_runner runner;
    auto start = steady_clock::now();
    auto result = runner.run(shell("sleep 30 & echo done"), "", seconds(5));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.output, "done\n");
    EXPECT_LT(steady_clock::now() - start, seconds(3));
}

TEST(RunnerTest, ExitCodeTest) {
    process_runner runner;
    auto result = runner.run(shell("echo 3; exit 7"), "", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.exit_code, 7);
    EXPECT_EQ(result.output, "3\n");
}

TEST(RunnerTest, SignalTest) {
    process_runner runner;
    auto result = runner.run(shell("kill -SEGV $$"), "", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
}

TEST(RunnerTest, StderrTest) {
    process_runner runner;
    auto result = runner.run(shell("echo out; echo err >&2"), "", seconds(1));
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error_output, "err\n");
}

TEST(RunnerTest, MergeStderrTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "echo out; echo err >&2"};
    opt.merge_stderr = true;
    auto result = run_process(opt, "", nullopt);
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.output, "out\nerr\n");
}

TEST(RunnerTest, StderrLimitTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "head -c 100000 /dev/zero >&2"};
    opt.stderr_limit = 100;
    auto result = run_process(opt, "", seconds(2));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.error_output.size(), 100u);
}

TEST(RunnerTest, OutputLimitTest) {
    // 无限输出的程序在超出输出限制时立即被杀死，不必等到时间限制
    process_options opt;
    opt.command = {"/bin/sh", "-c", "yes"};
    opt.output_limit = 1000;
    auto start = steady_clock::now();
    auto result = run_process(opt, "", seconds(5));
    EXPECT_EQ(result.outcome, execution_outcome::OUTPUT_LIMIT_EXCEEDED);
    EXPECT_TRUE(result.output.empty());
    EXPECT_LT(steady_clock::now() - start, seconds(3));
}

TEST(RunnerTest, OutputAtLimitTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "head -c 1000 /dev/zero"};
    opt.output_limit = 1000;
    auto result = run_process(opt, "", seconds(2));
    EXPECT_EQ(result.outcome, execution_outcome::COMPLETED);
    EXPECT_EQ(result.output.size(), 1000u);
}

TEST(RunnerTest, FailedToStartTest) {
    process_runner runner;
    auto result = runner.run({{"bayview-no-such-program"}, test_run_dir()}, "", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::FAILED_TO_START);
    EXPECT_NE(result.error.find("bayview-no-such-program"), string::npos);
}

TEST(RunnerTest, MissingWorkDirTest) {
    process_runner runner;
    auto result = runner.run({{"true"}, test_run_dir() / "no-such-dir"}, "", seconds(1));
    EXPECT_EQ(result.outcome, execution_outcome::FAILED_TO_START);
}

TEST(RunnerTest, WorkDirTest) {
    process_runner runner;
    auto result = runner.run({{"pwd"}, test_run_dir()}, "", seconds(1));
    EXPECT_EQ(result.output, canonical(test_run_dir()).string() + "\n");
}

TEST(RunnerTest, ChildProcessTerminateTest) {
    process_options opt;
    opt.command = {"sleep", "30"};
    child_process child(opt);
    EXPECT_GT(child.pid(), 0);
    EXPECT_FALSE(child.has_exited());
    child.terminate();
    int status = child.wait();
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST(RunnerTest, EmptyCommandTest) {
    process_options opt;
    EXPECT_THROW(child_process child(opt), launch_error);
}
