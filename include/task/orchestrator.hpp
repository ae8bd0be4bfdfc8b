#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "runner/runner.hpp"
#include "store/task_store.hpp"
#include "task/task.hpp"

namespace engine {

/**
 * @brief 一个评测任务的文件路径
 * RUN_DIR/<task_id>/code<task_id>.<ext> 和 RUN_DIR/<task_id>/binary<task_id>
 */
struct task_paths {
    std::filesystem::path workdir;
    std::filesystem::path source;
    std::filesystem::path artifact;
};

/**
 * @throw configuration_error 不支持该语言
 */
task_paths make_task_paths(const std::filesystem::path &run_dir, const std::string &task_id, const std::string &language);

/**
 * @brief 比较选手输出和标准输出，忽略首尾空白
 */
verdict judge_output(const std::string &actual, const std::string &expected);

/**
 * @brief 评测任务的执行者
 * 对于每个评测任务：
 * 1. 插入 PENDING 的评测记录
 * 2. 根据语言创建 runner，不支持的语言直接失败，评测记录保持 PENDING
 * 3. 写入源代码并编译，编译失败时记录编译器的错误信息，跳过所有测试点
 * 4. 按照提交的顺序依次运行每个测试点，一个测试点运行失败不影响其他测试点
 * 5. 以一次更新写入所有测试点的结果，并将记录标记为 COMPLETED
 * 6. 无论评测成功与否，删除源代码、产物和任务文件夹
 * 可以被多个 worker 并发调用，不同任务的文件在各自的文件夹中。
 */
struct task_orchestrator {
    /**
     * @param store 评测结果存储，生命周期必须长于 task_orchestrator
     * @param run_dir 评测文件夹的根目录
     * @param time_limit 每个测试点的墙钟时间限制
     */
    task_orchestrator(task_store &store, const std::filesystem::path &run_dir, std::chrono::milliseconds time_limit);

    /**
     * @brief 评测一个任务
     * @return 写入评测结果存储的最终记录
     * @throw configuration_error 不支持该语言
     * @throw io_error 无法写入或删除评测文件
     * @throw database_error 无法写入评测记录
     */
    task_status_record execute(const queued_job &job);

    /**
     * @brief 同步试运行，只运行一次，不写入评测结果存储
     * @throw configuration_error 不支持该语言
     */
    test_run_response test_run(const test_run_request &request);

private:
    test_case_result evaluate(runner &r, const std::filesystem::path &artifact_path, const test_case &tc);

    task_store &store;
    std::filesystem::path run_dir;
    std::chrono::milliseconds time_limit;
};

}  // namespace engine
