#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <sstream>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"

using namespace std;
using namespace engine;

class SandboxTest : public ::testing::Test {
protected:
    static execution_result sh(const string &script, const string &input = "", chrono::milliseconds time_limit = chrono::seconds(5)) {
        return run({"/bin/sh", "-c", script}, input, time_limit);
    }

    static string output_of(const execution_result &result) {
        EXPECT_TRUE(holds_alternative<execution_output>(result));
        if (!holds_alternative<execution_output>(result)) return get<execution_error>(result).message;
        return get<execution_output>(result).stdout_text;
    }

    static string error_of(const execution_result &result) {
        EXPECT_TRUE(holds_alternative<execution_error>(result));
        if (!holds_alternative<execution_error>(result)) return "";
        return get<execution_error>(result).message;
    }
};

TEST_F(SandboxTest, EchoStdin) {
    EXPECT_EQ(output_of(sh("cat", "2 3\n")), "2 3\n");
}

TEST_F(SandboxTest, EmptyStdin) {
    EXPECT_EQ(output_of(sh("echo hello")), "hello\n");
}

TEST_F(SandboxTest, ExitCode) {
    EXPECT_EQ(error_of(sh("exit 42")), "Program terminated with code: 42");
}

TEST_F(SandboxTest, StderrIsReported) {
    EXPECT_EQ(error_of(sh("echo boom >&2; exit 1")), "boom\n");
}

TEST_F(SandboxTest, FaultSignal) {
    EXPECT_EQ(error_of(sh("kill -SEGV $$")), "Program terminated with signal: SIGSEGV");
    EXPECT_EQ(error_of(sh("kill -FPE $$")), "Program terminated with signal: SIGFPE");
}

TEST_F(SandboxTest, NoControllingTerminal) {
    // setsid 之后子进程是会话首进程，其进程组 id 等于进程 id
    process_outcome outcome = run_process({"/bin/sh", "-c", "ps -o pgid= -p $$; echo $$"}, "", chrono::seconds(5));
    if (!outcome.success()) GTEST_SKIP() << "ps is not available";
    vector<string> lines;
    stringstream ss(outcome.stdout_text);
    for (string line; getline(ss, line);) lines.push_back(boost::algorithm::trim_copy(line));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], lines[1]);
}

TEST_F(SandboxTest, MissingBinary) {
    string message = error_of(run({"/nonexistent/binary"}, "", chrono::seconds(5)));
    EXPECT_EQ(message, "Failed to execute binary: No such file or directory");

    process_outcome outcome = run_process({"/nonexistent/binary"}, "input", chrono::seconds(5));
    EXPECT_TRUE(outcome.exited);
    EXPECT_EQ(outcome.exit_code, 127);
    EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(SandboxTest, NotExecutable) {
    string message = error_of(run({"/etc/passwd"}, "", chrono::seconds(5)));
    EXPECT_EQ(message, "Failed to execute binary: Permission denied");
}

TEST_F(SandboxTest, LargeOutput) {
    // 输出远大于管道缓冲区，需要在子进程运行时持续读取
    string result = output_of(sh("head -c 1000000 /dev/zero | tr '\\0' 'a'"));
    EXPECT_EQ(result.size(), 1000000u);
}

TEST_F(SandboxTest, LargeUnreadStdinDoesNotBlock) {
    // 子进程从不读取输入，写入输入不应该阻塞
    string input(4 * 1024 * 1024, 'x');
    elapsed_time timer;
    EXPECT_EQ(output_of(sh("echo done", input)), "done\n");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 3000);
}

TEST_F(SandboxTest, LargeStdinIsFullyDelivered) {
    string input(1024 * 1024, 'x');
    EXPECT_EQ(boost::algorithm::trim_copy(output_of(sh("wc -c", input))), "1048576");
}

TEST_F(SandboxTest, Timeout) {
    filesystem::path pidfile = filesystem::temp_directory_path() / ("sandbox-timeout-" + to_string(getpid()));
    remove_if_exists(pidfile);

    elapsed_time timer;
    auto result = sh("echo $$ > " + pidfile.string() + "; exec sleep 30", "", chrono::milliseconds(500));
    auto elapsed = timer.duration<chrono::milliseconds>().count();

    EXPECT_EQ(error_of(result), "Process timed out and killed");
    EXPECT_GE(elapsed, 500);
    EXPECT_LT(elapsed, 5000);

    // 子进程已经被回收，不再运行
    pid_t pid = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(read_file_content(pidfile)));
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    remove_if_exists(pidfile);
}

TEST_F(SandboxTest, TimeoutKillsProcessGroup) {
    // 子进程 fork 出来的后台进程持有 stdout，超时后也必须返回
    elapsed_time timer;
    auto result = sh("sleep 30 & sleep 30", "", chrono::milliseconds(500));
    EXPECT_EQ(error_of(result), "Process timed out and killed");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
}

TEST_F(SandboxTest, BackgroundProcessAfterExit) {
    // 子进程退出后遗留的后台进程会被杀死，不会阻塞读取输出
    elapsed_time timer;
    EXPECT_EQ(output_of(sh("sleep 30 & echo bye")), "bye\n");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
}
