#include "store/memory_task_store.hpp"
#include "common/exceptions.hpp"

namespace engine {
using namespace std;

task_store::~task_store() = default;

void memory_task_store::insert(const task_status_record &record) {
    lock_guard<mutex> guard(mut);
    records[record.task_id] = record;
}

void memory_task_store::update_by_id(const string &task_id, const task_status_update &update) {
    lock_guard<mutex> guard(mut);
    auto it = records.find(task_id);
    if (it == records.end())
        throw database_error("No task status record with id " + task_id);
    update.apply(it->second);
}

optional<task_status_record> memory_task_store::find_by_id(const string &task_id) {
    lock_guard<mutex> guard(mut);
    auto it = records.find(task_id);
    if (it == records.end()) return nullopt;
    return it->second;
}

size_t memory_task_store::size() const {
    lock_guard<mutex> guard(mut);
    return records.size();
}

}  // namespace engine
