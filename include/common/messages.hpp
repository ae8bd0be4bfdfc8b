#pragma once

#include <any>
#include "task/task.hpp"

namespace engine::message {

/**
 * @brief 从消息队列拉取到的一个评测任务
 * 由 consumer 线程推入评测队列，worker 评测完成后凭 envelope 确认消息
 */
struct job_delivery {
    queued_job job;

    /**
     * @brief 消息队列的投递凭证，具体类型由 job_server 的实现决定
     * 对于 RabbitMQ 为 AmqpClient::Envelope::ptr_t
     */
    std::any envelope;
};

}  // namespace engine::message
