#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include "server/config.hpp"

namespace engine::server {

/**
 * @brief 与消息队列交互的类
 * AMQP channel 不是线程安全的，所有对 channel 的操作都通过 mut 串行化
 */
struct rabbitmq {
    /**
     * @brief 连接消息队列并声明持久化队列
     * 连接失败时每隔 CONNECT_RETRY_INTERVAL 重试，最多重试 CONNECT_MAX_RETRIES 次
     * @param write 为真时只用于发送消息，不监听队列
     * @param prefetch 监听队列时最多同时持有多少条未确认的消息
     * @throw network_error 重试次数用尽
     */
    rabbitmq(const amqp &amqp, bool write, std::uint16_t prefetch = 1);

    /**
     * @brief 拉取一条消息
     * @param timeout 最多等待的时间
     * @return 是否拉取到消息
     */
    bool fetch(AmqpClient::Envelope::ptr_t &envelope, std::chrono::milliseconds timeout);

    void ack(const AmqpClient::Envelope::ptr_t &envelope);

    /**
     * @brief 持久化地发送一条消息
     * 配置了 Exchange 时发送到 Exchange，否则通过默认 Exchange 直接发送到队列
     */
    void publish(const std::string &message);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    std::string tag;
    amqp queue;
    bool write;
    std::uint16_t prefetch;
    std::mutex mut;
};

}  // namespace engine::server
