#pragma once

#include <chrono>
#include "common/messages.hpp"

namespace engine::server {

/**
 * @brief 表示评测任务的来源
 * 实现必须保证 fetch_job 和 acknowledge 可以在不同线程中调用
 */
struct job_server {
    virtual ~job_server();

    /**
     * @brief 获取一个评测任务
     * @param delivery 存储该评测任务
     * @param timeout 最多等待多久
     * @return 是否获取到评测任务，超时返回 false
     * @throw std::exception 消息格式不正确，此时消息已经被确认，不会被重新投递
     */
    virtual bool fetch_job(message::job_delivery &delivery, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 评测任务结束后确认消息，之后消息队列不再重新投递该任务
     * 每个获取到的评测任务必须恰好确认一次
     */
    virtual void acknowledge(const message::job_delivery &delivery) = 0;
};

}  // namespace engine::server
