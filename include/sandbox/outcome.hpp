#pragma once

#include <string>
#include <variant>
#include "sandbox/process.hpp"

namespace engine {

/**
 * @brief 选手程序成功运行，保存其标准输出
 */
struct execution_output {
    std::string stdout_text;
};

/**
 * @brief 选手程序运行失败，保存面向用户的错误信息
 */
struct execution_error {
    std::string message;
};

/**
 * @brief 运行一次选手程序的结果，要么是标准输出，要么是错误信息
 * 运行失败不是异常，通过 std::visit 区分两种情况
 */
typedef std::variant<execution_output, execution_error> execution_result;

extern const char *const TIMEOUT_MESSAGE;

/**
 * @brief 返回致命信号的名字
 * @return SIGSEGV、SIGFPE、SIGILL、SIGABRT、SIGBUS 返回其名字，其他信号返回 "Unknown Signal"
 */
std::string signal_name(int sig);

/**
 * @brief 将子进程的运行信息分类为运行结果，按照以下优先级：
 * 1. 超时，返回 "Process timed out and killed"
 * 2. 正常退出，返回值为 0，且标准输出是合法的 UTF-8，返回标准输出
 * 3. 标准错误流非空，返回标准错误流的内容（即使子进程是被信号杀死的）
 * 4. 被信号杀死，返回 "Program terminated with signal: <NAME>"
 * 5. 返回 "Program terminated with code: <返回值>"
 */
execution_result classify(const process_outcome &outcome);

bool is_success(const execution_result &result);

}  // namespace engine
