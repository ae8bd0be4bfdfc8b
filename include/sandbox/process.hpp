#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含启动子进程并收集其运行结果的函数
 * 子进程在独立的会话与进程组中运行，没有控制终端，
 * 超时或结束后，我们通过向整个进程组发送信号来清理子进程产生的所有进程。
 */
namespace engine {

/**
 * @brief 子进程结束后的原始运行信息，交给 classifier 进行分类
 */
struct process_outcome {
    /**
     * @brief 子进程是否因为超出墙钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 子进程是否通过 exit 正常退出
     */
    bool exited = false;

    /**
     * @brief 子进程的返回值，仅在 exited 为真时有意义
     */
    int exit_code = -1;

    /**
     * @brief 终止子进程的信号，0 表示不是因为信号终止
     */
    int signal = 0;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 子进程是否正常退出且返回值为 0
     */
    bool success() const;
};

/**
 * @brief 运行外部命令
 * 1. 创建管道连接子进程的 stdin、stdout、stderr
 * 2. 调用 fork 创建子进程，子进程通过 setsid 分离到独立的会话和进程组，再 execvp 执行命令
 * 3. 父进程在同一个 poll 循环中写入 stdin_text、读取 stdout 和 stderr，
 *    因此即使子进程从不读取输入，写入也不会永久阻塞
 * 4. 若超出 time_limit，先发送 SIGTERM，等待 0.1 秒后发送 SIGKILL 杀死整个进程组
 * 5. 子进程退出后，杀死进程组内残留的进程，确保选手程序 fork 出来的进程不会留驻系统
 *
 * @param command 命令的路径 (command[0]) 和参数
 * @param stdin_text 要喂给子进程 stdin 的内容
 * @param time_limit 墙钟时间限制，为空表示不限制
 * @return 子进程的运行信息
 * @throw std::system_error 创建管道、fork 或等待子进程失败
 */
process_outcome run_process(const std::vector<std::string> &command,
                            const std::string &stdin_text,
                            std::optional<std::chrono::milliseconds> time_limit);

}  // namespace engine
