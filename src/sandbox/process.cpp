#include "sandbox/process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include "common/defer.hpp"

namespace engine {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

// 子进程退出后，最多再等待这么久来读完管道中残留的输出
const chrono::milliseconds drain_limit(1000);

const chrono::milliseconds poll_interval(50);

const size_t BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

static void error(int err, const string &what) {
    throw system_error(err, system_category(), what);
}

static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] {
        // 子进程关闭 stdin 后继续写入会产生 SIGPIPE，我们改为处理 EPIPE
        struct sigaction sigact;
        sigact.sa_handler = SIG_IGN;
        sigact.sa_flags = 0;
        if (sigemptyset(&sigact.sa_mask) != 0 || sigaction(SIGPIPE, &sigact, nullptr) != 0)
            LOG(WARNING) << "could not ignore SIGPIPE";
    });
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    close(fd);
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

static void kill_group(pid_t pid, int sig) {
    // Don't report an already exited process group as error.
    if (kill(-pid, sig) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send signal " << sig << " to process group " << pid << ": " << strerror(errno);
}

/**
 * @brief 检查子进程是否已经结束
 * 使用 WNOWAIT 不回收子进程，这样在杀死进程组之前子进程的 pid 不会被系统复用
 */
static bool child_exited(pid_t pid) {
    siginfo_t info;
    info.si_pid = 0;
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) return false;
        error(errno, "waiting on child");
    }
    return info.si_pid == pid;
}

static int reap(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, "reaping child");
    }
    return status;
}

static void pump_input(int &fd, const string &data, size_t &written) {
    size_t to_write = min(data.size() - written, BUF_SIZE * 16);
    ssize_t nwritten = write(fd, data.data() + written, to_write);
    if (nwritten < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        if (errno == EPIPE) {  // 子进程不再读取输入
            close_fd(fd);
            return;
        }
        error(errno, "writing to child stdin");
    }
    written += nwritten;
    if (written == data.size()) close_fd(fd);
}

static void pump_output(int &fd, string &buffer) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        error(errno, "reading child output");
    }
    if (nread == 0) {  // EOF detected
        close_fd(fd);
        return;
    }
    buffer.append(buf, nread);
}

bool process_outcome::success() const {
    return exited && exit_code == 0;
}

process_outcome run_process(const vector<string> &command, const string &stdin_text, optional<chrono::milliseconds> time_limit) {
    if (command.empty()) throw invalid_argument("empty command");
    ignore_sigpipe();

    DLOG(INFO) << "Running " << boost::algorithm::join(command, " ");

    // fork 之后子进程只允许调用 async-signal-safe 的函数，因此参数要提前准备好
    vector<char *> args;
    for (auto &arg : command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    // 最后一个管道用于子进程报告 exec 失败时的 errno，exec 成功后随 O_CLOEXEC 关闭
    int pipefd[4][2] = {{-1, -1}, {-1, -1}, {-1, -1}, {-1, -1}};
    defer {
        for (auto &fds : pipefd) {
            close_fd(fds[PIPE_OUT]);
            close_fd(fds[PIPE_IN]);
        }
    };
    for (int i = 0; i < 4; ++i)
        if (pipe2(pipefd[i], O_CLOEXEC) != 0) error(errno, fmt::format("creating pipe for fd {}", i));
    int &exec_status = pipefd[3][PIPE_OUT];

    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");
    if (pid == 0) {
        // 脱离控制终端，并成为新进程组的组长，以便通过 kill(-pid) 杀死所有后代进程
        setsid();
        signal(SIGPIPE, SIG_DFL);
        if (dup2(pipefd[STDIN_FILENO][PIPE_OUT], STDIN_FILENO) >= 0 &&
            dup2(pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) >= 0 &&
            dup2(pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) >= 0)
            execvp(args[0], args.data());

        // 这里只能调用 async-signal-safe 的函数，错误信息由父进程生成
        int err = errno;
        if (write(pipefd[3][PIPE_IN], &err, sizeof(err)) < 0) {
        }
        _exit(127);
    }

    // 若在回收子进程之前出现异常，确保子进程不会留驻系统
    scoped_guard child_guard([pid] {
        kill_group(pid, SIGKILL);
        int status;
        waitpid(pid, &status, 0);
    });

    close_fd(pipefd[STDIN_FILENO][PIPE_OUT]);
    close_fd(pipefd[STDOUT_FILENO][PIPE_IN]);
    close_fd(pipefd[STDERR_FILENO][PIPE_IN]);
    close_fd(pipefd[3][PIPE_IN]);

    process_outcome outcome;

    // 读到 EOF 说明 exec 成功，读到 errno 说明 exec 失败
    int exec_errno = 0;
    ssize_t nread;
    while ((nread = read(exec_status, &exec_errno, sizeof(exec_errno))) < 0) {
        if (errno != EINTR) error(errno, "reading exec status of child");
    }
    close_fd(exec_status);
    if (nread == (ssize_t)sizeof(exec_errno)) {
        int status = reap(pid);
        child_guard.dismiss();
        outcome.exited = WIFEXITED(status);
        outcome.exit_code = outcome.exited ? WEXITSTATUS(status) : 0;
        outcome.stderr_text = fmt::format("Failed to execute binary: {}", strerror(exec_errno));
        LOG(WARNING) << "Unable to execute " << command[0] << ": " << strerror(exec_errno);
        return outcome;
    }

    int &input = pipefd[STDIN_FILENO][PIPE_IN];
    int &output = pipefd[STDOUT_FILENO][PIPE_OUT];
    int &errput = pipefd[STDERR_FILENO][PIPE_OUT];
    set_nonblocking(input);
    set_nonblocking(output);
    set_nonblocking(errput);

    size_t written = 0;
    if (stdin_text.empty()) close_fd(input);

    optional<chrono::steady_clock::time_point> deadline;
    if (time_limit) deadline = chrono::steady_clock::now() + *time_limit;
    chrono::steady_clock::time_point drain_deadline;
    bool exited = false;

    while (true) {
        if (!exited && child_exited(pid)) {
            exited = true;
            kill_group(pid, SIGKILL);
            close_fd(input);
            drain_deadline = chrono::steady_clock::now() + drain_limit;
        }

        if (exited && output < 0 && errput < 0) break;

        auto now = chrono::steady_clock::now();
        if (!exited && deadline && now >= *deadline) {
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << command[0];
            outcome.timed_out = true;
            // First try to kill graciously, then hard.
            kill_group(pid, SIGTERM);
            nanosleep(&killdelay, nullptr);
            kill_group(pid, SIGKILL);
            break;
        }
        if (exited && now >= drain_deadline) {
            LOG(WARNING) << "output of " << command[0] << " is still open after it exited, stop reading";
            break;
        }

        auto wait = poll_interval;
        if (!exited && deadline)
            wait = min(wait, chrono::duration_cast<chrono::milliseconds>(*deadline - now) + chrono::milliseconds(1));

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (input >= 0) fds[nfds++] = {input, POLLOUT, 0};
        if (output >= 0) fds[nfds++] = {output, POLLIN, 0};
        if (errput >= 0) fds[nfds++] = {errput, POLLIN, 0};

        int r = poll(fds, nfds, (int)wait.count());
        if (r < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }

        for (nfds_t k = 0; k < nfds; ++k) {
            if (!fds[k].revents) continue;
            if (fds[k].fd == input)
                pump_input(input, stdin_text, written);
            else if (fds[k].fd == output)
                pump_output(output, outcome.stdout_text);
            else if (fds[k].fd == errput)
                pump_output(errput, outcome.stderr_text);
        }
    }

    int status = reap(pid);
    child_guard.dismiss();

    if (WIFEXITED(status)) {
        outcome.exited = true;
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
        if (!outcome.timed_out)
            LOG(WARNING) << "Command terminated with signal (" << outcome.signal << ", " << strsignal(outcome.signal) << ")";
    }

    return outcome;
}

}  // namespace engine
