#pragma once

#include <string>
#include <utility>
#include <vector>
#include "server/redis.hpp"
#include "store/task_store.hpp"

namespace engine {

typedef std::vector<std::pair<std::string, std::string>> hash_fields;

/**
 * @brief 将完整的记录转换为 HMSET 的字段列表
 */
hash_fields to_hash_fields(const task_status_record &record);

/**
 * @brief 将部分更新转换为 HMSET 的字段列表，只包含需要修改的字段
 */
hash_fields to_hash_fields(const task_status_update &update);

/**
 * @brief 将 HGETALL 的回复（字段名和值交替出现的数组）转换为记录
 * @throw database_error 缺少字段或字段值无法解析
 */
task_status_record parse_hash_reply(const cpp_redis::reply &reply);

/**
 * @brief 保存在 Redis 中的评测结果存储
 * 每条记录是一个 hash，键为 <key_prefix><task_id>，字段为：
 * task_id, status, compiler_error_msg, test_case_result (JSON 数组), created_at
 * 如果配置了 channel，记录更新为 COMPLETED 后会将完整的记录 publish 到该 channel
 */
struct redis_task_store : public task_store {
    explicit redis_task_store(const server::redis &redis_config);

    void insert(const task_status_record &record) override;
    void update_by_id(const std::string &task_id, const task_status_update &update) override;
    std::optional<task_status_record> find_by_id(const std::string &task_id) override;

private:
    std::string key_of(const std::string &task_id) const;

    server::redis redis_config;
    server::redis_conn redis_server;
};

}  // namespace engine
