#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include "sandbox/outcome.hpp"

/**
 * 这个头文件包含表示编程语言工具链的类
 * 每个评测任务拥有一个 runner，runner 负责：
 * 1. initialize: 将选手的源代码写入任务独有的路径
 * 2. compile: 调用编译器（或解释器的语法检查）生成可执行的产物
 * 3. execute: 在沙箱中运行产物，每个测试点调用一次
 * 4. cleanup: 删除源代码和产物，无论评测成功与否都会被调用恰好一次
 * 编译型语言和解释型语言共享相同的接口。
 */
namespace engine {

/**
 * @brief 表示选手程序编译错误
 * error_log 保存编译器原封不动的标准错误输出
 */
struct compilation_error : public std::runtime_error {
public:
    const std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log);
};

struct runner {
    virtual ~runner();

    /**
     * @brief 将源代码写入 source_path
     * @throw io_error 无法创建或写入文件
     */
    virtual void initialize(const std::filesystem::path &source_path) = 0;

    /**
     * @brief 编译源代码，编译过程没有时间限制
     * @return 编译成功的提示信息
     * @throw compilation_error 编译器返回非 0
     */
    virtual std::string compile(const std::filesystem::path &source_path, const std::filesystem::path &artifact_path) = 0;

    /**
     * @brief 以 stdin_text 作为输入运行产物
     * @return 程序的标准输出，或者运行错误的信息
     */
    virtual execution_result execute(const std::filesystem::path &artifact_path, const std::string &stdin_text) = 0;

    /**
     * @brief 删除源代码和产物，文件不存在时什么也不做，因此可以重复调用
     */
    virtual void cleanup(const std::filesystem::path &source_path, const std::filesystem::path &artifact_path) = 0;
};

typedef std::unique_ptr<runner> runner_uptr;

/**
 * @brief 保存选手源代码的 runner 基类
 * 负责所有语言通用的 initialize 和 cleanup
 */
struct source_runner : public runner {
    source_runner(const std::string &source_code, std::chrono::milliseconds time_limit);

    void initialize(const std::filesystem::path &source_path) override;

    void cleanup(const std::filesystem::path &source_path, const std::filesystem::path &artifact_path) override;

protected:
    std::string source_code;

    /**
     * @brief 每次运行产物的墙钟时间限制
     */
    std::chrono::milliseconds time_limit;
};

}  // namespace engine
