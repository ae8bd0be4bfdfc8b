#pragma once

#include "runner/runner.hpp"

namespace engine {

/**
 * @brief 编译为本地可执行文件的语言，比如 C 和 C++
 * 编译命令为 <compiler> <source> -o <artifact>，运行时直接执行产物
 */
struct native_runner : public source_runner {
    native_runner(const std::string &compiler, const std::string &source_code, std::chrono::milliseconds time_limit);

    std::string compile(const std::filesystem::path &source_path, const std::filesystem::path &artifact_path) override;

    execution_result execute(const std::filesystem::path &artifact_path, const std::string &stdin_text) override;

private:
    std::string compiler;
};

}  // namespace engine
