#pragma once

#include <map>
#include <mutex>
#include "store/task_store.hpp"

namespace engine {

/**
 * @brief 保存在进程内的评测结果存储，未配置 redis 或试运行时使用
 */
struct memory_task_store : public task_store {
    void insert(const task_status_record &record) override;
    void update_by_id(const std::string &task_id, const task_status_update &update) override;
    std::optional<task_status_record> find_by_id(const std::string &task_id) override;

    std::size_t size() const;

private:
    std::map<std::string, task_status_record> records;
    mutable std::mutex mut;
};

}  // namespace engine
