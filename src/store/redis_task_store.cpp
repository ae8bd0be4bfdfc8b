#include "store/redis_task_store.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"

namespace engine {
using namespace std;
using namespace nlohmann;

hash_fields to_hash_fields(const task_status_record &record) {
    return {{"task_id", record.task_id},
            {"status", to_string((int)record.status)},
            {"compiler_error_msg", record.compiler_error_message},
            {"test_case_result", json(record.test_case_results).dump()},
            {"created_at", to_string(record.created_at)}};
}

hash_fields to_hash_fields(const task_status_update &update) {
    hash_fields fields;
    if (update.status)
        fields.emplace_back("status", to_string((int)*update.status));
    if (update.compiler_error_message)
        fields.emplace_back("compiler_error_msg", *update.compiler_error_message);
    if (update.test_case_results)
        fields.emplace_back("test_case_result", json(*update.test_case_results).dump());
    return fields;
}

task_status_record parse_hash_reply(const cpp_redis::reply &reply) {
    if (!reply.is_array())
        throw database_error("Malformed task status record: reply is not an array");
    json j = json::object();
    auto &array = reply.as_array();
    if (array.size() % 2 != 0)
        throw database_error("Malformed task status record: odd number of hash entries");
    for (size_t i = 0; i < array.size(); i += 2) {
        if (!array[i].is_string() || !array[i + 1].is_string())
            throw database_error("Malformed task status record: hash entry is not a string");
        j[array[i].as_string()] = array[i + 1].as_string();
    }

    try {
        task_status_record record;
        record.task_id = j.at("task_id").get<string>();
        j["status"] = boost::lexical_cast<int>(j.at("status").get<string>());
        j["created_at"] = boost::lexical_cast<time_t>(j.at("created_at").get<string>());
        j["test_case_result"] = json::parse(j.at("test_case_result").get<string>());
        j.get_to(record);
        return record;
    } catch (json::exception &ex) {
        throw database_error(string("Malformed task status record: ") + ex.what());
    } catch (boost::bad_lexical_cast &ex) {
        throw database_error(string("Malformed task status record: ") + ex.what());
    } catch (invalid_argument &ex) {
        throw database_error(string("Malformed task status record: ") + ex.what());
    }
}

redis_task_store::redis_task_store(const server::redis &redis_config) : redis_config(redis_config) {
    redis_server.init(redis_config);
}

string redis_task_store::key_of(const string &task_id) const {
    return redis_config.key_prefix + task_id;
}

void redis_task_store::insert(const task_status_record &record) {
    string key = key_of(record.task_id);
    hash_fields fields = to_hash_fields(record);
    redis_server.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        // 重复投递的任务会覆盖旧的记录
        replies.push_back(redis.multi());
        replies.push_back(redis.del({key}));
        replies.push_back(redis.hmset(key, fields));
        replies.push_back(redis.exec());
    });
    DLOG(INFO) << "Inserted task status record " << key;
}

void redis_task_store::update_by_id(const string &task_id, const task_status_update &update) {
    string key = key_of(task_id);
    auto exists = redis_server.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.exists({key}));
    });
    if (exists.front().as_integer() == 0)
        throw database_error("No task status record with id " + task_id);

    hash_fields fields = to_hash_fields(update);
    if (fields.empty()) return;
    redis_server.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.hmset(key, fields));
    });

    if (!redis_config.channel.empty() && update.status == lifecycle_state::COMPLETED) {
        auto record = find_by_id(task_id);
        if (!record)
            throw database_error("Task status record " + task_id + " disappeared after update");
        string message = json(*record).dump();
        redis_server.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
            replies.push_back(redis.publish(redis_config.channel, message));
        });
    }
}

optional<task_status_record> redis_task_store::find_by_id(const string &task_id) {
    string key = key_of(task_id);
    auto result = redis_server.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.hgetall(key));
    });
    auto &reply = result.front();
    if (!reply.is_array() || reply.as_array().empty()) return nullopt;
    return parse_hash_reply(reply);
}

}  // namespace engine
