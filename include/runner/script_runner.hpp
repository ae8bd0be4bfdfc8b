#pragma once

#include <vector>
#include "runner/runner.hpp"

namespace engine {

/**
 * @brief 由解释器执行的语言，比如 Python
 * 编译阶段只做语法检查，然后将脚本复制到产物路径，运行时执行 <interpreter> <artifact>
 */
struct script_runner : public source_runner {
    /**
     * @param interpreter 解释器的命令名
     * @param syntax_check 语法检查的命令参数，检查的源文件路径会追加到最后
     */
    script_runner(const std::string &interpreter, const std::vector<std::string> &syntax_check,
                  const std::string &source_code, std::chrono::milliseconds time_limit);

    std::string compile(const std::filesystem::path &source_path, const std::filesystem::path &artifact_path) override;

    execution_result execute(const std::filesystem::path &artifact_path, const std::string &stdin_text) override;

private:
    std::string interpreter;
    std::vector<std::string> syntax_check;
};

}  // namespace engine
