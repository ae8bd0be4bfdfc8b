#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "runner/runner.hpp"

namespace engine {

/**
 * @brief 根据语言创建 runner
 * 支持的语言是一张封闭的表，新增语言只需要在表中增加一项
 * @param language 语言标识，比如 cpp、c、python3
 * @param source_code 选手的源代码
 * @param time_limit 每次运行的墙钟时间限制
 * @throw configuration_error 不支持该语言，此时不会产生任何文件或进程
 */
runner_uptr make_runner(const std::string &language, const std::string &source_code, std::chrono::milliseconds time_limit);

/**
 * @brief 获得该语言源代码文件的扩展名，不含点号
 * @throw configuration_error 不支持该语言
 */
std::string source_extension(const std::string &language);

bool is_supported_language(const std::string &language);

std::vector<std::string> supported_languages();

}  // namespace engine
