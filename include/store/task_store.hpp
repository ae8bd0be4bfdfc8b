#pragma once

#include <optional>
#include <string>
#include "task/task.hpp"

namespace engine {

/**
 * @brief 评测结果存储
 * 每个 task_id 恰好一条记录：先以 PENDING 插入，评测结束后以一次 update 更新为 COMPLETED。
 * 实现需要保证多个 worker 并发调用是安全的。
 */
struct task_store {
    virtual ~task_store();

    /**
     * @brief 插入一条评测记录
     * 消息队列可能重复投递同一个评测任务，因此已存在的同 id 记录会被整体覆盖
     * @throw database_error 存储不可用
     */
    virtual void insert(const task_status_record &record) = 0;

    /**
     * @brief 更新记录中 update 给出的字段，其余字段不变
     * @throw database_error 记录不存在或存储不可用
     */
    virtual void update_by_id(const std::string &task_id, const task_status_update &update) = 0;

    /**
     * @brief 查询评测记录，记录不存在是正常情况
     * @return 最后一次写入的记录，不存在时为空
     * @throw database_error 存储不可用
     */
    virtual std::optional<task_status_record> find_by_id(const std::string &task_id) = 0;
};

}  // namespace engine
