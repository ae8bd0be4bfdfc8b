#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace engine {

/**
 * @brief 选手程序编译及运行的根目录
 * 每个评测任务在 RUN_DIR 下拥有一个以 task_id 命名的独立文件夹，
 * 因此并发评测的任务之间不会出现文件名冲突。
 *
 * RUN_DIR
 * ├── 8c1c6a52-... // task_id
 * │   ├── code8c1c6a52-....cpp // 选手程序的源代码
 * │   └── binary8c1c6a52-... // 编译产生的可执行文件
 * └── ...
 * 评测结束后，任务文件夹会被删除。
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 每个测试点运行选手程序的墙钟时间限制
 * @defaultValue 5 秒
 */
extern std::chrono::milliseconds EXECUTION_TIME_LIMIT;

/**
 * @brief 同时进行评测的 worker 数量，也是内部评测队列的容量
 */
extern std::size_t WORKER_NUM;

/**
 * @brief 消息队列的 prefetch 数量，等于 worker 数量
 * prefetch 为 0 表示不限制，因此 worker 数量必须在 [1, 65535] 之间
 * @throw configuration_error worker 数量超出范围
 */
std::uint16_t prefetch_count(std::size_t worker_num);

/**
 * @brief 启动时连接消息队列失败后的最大重试次数
 * 12 次，每次间隔 5 秒，即大约一分钟
 */
extern unsigned CONNECT_MAX_RETRIES;

/**
 * @brief 启动时连接消息队列失败后的重试间隔
 */
extern std::chrono::milliseconds CONNECT_RETRY_INTERVAL;

}  // namespace engine
