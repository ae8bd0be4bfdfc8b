#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace engine::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname = "localhost";

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    /**
     * @brief 评测任务所在的持久化队列名
     */
    std::string queue = "SUBMISSION_QUEUE";

    /**
     * @brief 队列绑定的 Exchange 名，为空时使用默认 Exchange，不声明也不绑定
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type = "direct";

    /**
     * @brief 发送评测任务时使用的 Routing Key，Exchange 为空时使用队列名
     */
    std::string routing_key;

    std::string username = "guest";

    std::string password = "guest";

    std::string vhost = "/";
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * redis 的登录情况
 */
struct redis {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "localhost";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;

    /**
     * @brief 发布的通道名，允许服务端通过 subscribe 来监听评测完成的记录
     * 如果为空，那么不发布
     */
    std::string channel;

    /**
     * @brief 评测记录的键前缀，每条记录保存在 <key_prefix><task_id> 的 hash 中
     */
    std::string key_prefix = "task_status:";
};

void from_json(const nlohmann::json &j, redis &redis_config);

/**
 * @brief code-engine 的配置文件
 * {
 *     "amqp": { ... },
 *     "redis": { ... }
 * }
 * redis 缺省时评测记录只保存在进程内
 */
struct engine_config {
    amqp queue;

    bool has_redis = false;

    redis redis_config;
};

void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 读取并解析配置文件
 * @throw configuration_error 文件不存在或格式不正确
 */
engine_config load_config(const std::filesystem::path &config_path);

}  // namespace engine::server
