#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "sandbox/outcome.hpp"

namespace engine {

/**
 * @brief 在墙钟时间限制下运行选手程序，并对运行结果进行分类
 * @param command 要执行的命令及其参数
 * @param stdin_text 测试点的输入
 * @param time_limit 墙钟时间限制，超时后杀死整个进程组
 * @return 选手程序的标准输出，或者分类后的错误信息
 * @throw std::system_error 无法创建子进程
 */
execution_result run(const std::vector<std::string> &command, const std::string &stdin_text, std::chrono::milliseconds time_limit);

}  // namespace engine
