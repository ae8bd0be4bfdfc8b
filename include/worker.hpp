#pragma once

#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "server/job_server.hpp"
#include "task/orchestrator.hpp"

/**
 * 评测服务相关函数
 * job_queue 是 consumer 线程和 worker 线程之间的有界队列。
 *
 * consumer 线程不断从消息队列拉取评测任务并推入 job_queue，job_queue 满时
 * consumer 阻塞，不再拉取新的评测任务，未拉取的评测任务留在消息队列中等待。
 *
 * 固定数量的 worker 线程从 job_queue 中取出评测任务交给 task_orchestrator 评测，
 * 评测结束（无论成功与否）后确认消息。
 */
namespace engine {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。consumer 不再拉取新的评测任务，
 * worker 在完成并确认 job_queue 中所有评测任务后退出。
 */
void stop_workers();

/**
 * @brief 启动拉取评测任务的 consumer 线程
 * @param server 评测任务的来源
 * @param job_queue 推入拉取到的评测任务
 * @return 产生的线程
 */
std::thread start_consumer(server::job_server &server, concurrent_queue<message::job_delivery> &job_queue);

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 的编号，用于日志
 * @param server 用于确认评测结束的消息
 * @param orchestrator 评测任务的执行者
 * @param job_queue 评测任务队列
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, server::job_server &server, task_orchestrator &orchestrator, concurrent_queue<message::job_delivery> &job_queue);

}  // namespace engine
