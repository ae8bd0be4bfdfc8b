#pragma once

#include <memory>
#include "server/job_server.hpp"
#include "server/rabbitmq.hpp"

namespace engine::server {

/**
 * @brief 从 RabbitMQ 持久化队列中获取评测任务
 * 消息格式参见 task/task.hpp
 */
struct queue_job_server : public job_server {
    /**
     * @param config 消息队列配置
     * @param prefetch 最多同时持有多少条未确认的消息，通常等于 worker 数量
     * @throw network_error 无法连接消息队列
     */
    queue_job_server(const amqp &config, std::uint16_t prefetch);

    bool fetch_job(message::job_delivery &delivery, std::chrono::milliseconds timeout) override;

    void acknowledge(const message::job_delivery &delivery) override;

private:
    std::unique_ptr<rabbitmq> fetcher;
};

/**
 * @brief 向评测队列发送评测任务
 */
struct job_publisher {
    /**
     * @throw network_error 无法连接消息队列
     */
    explicit job_publisher(const amqp &config);

    /**
     * @brief 为评测请求生成 task_id，并持久化地发送到评测队列
     * @return 包含 task_id 的回执
     */
    task_response submit(const submission_request &request);

private:
    std::unique_ptr<rabbitmq> reporter;
};

}  // namespace engine::server
