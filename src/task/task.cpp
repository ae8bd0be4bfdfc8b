#include "task/task.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace engine {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const test_case &value) {
    j = {{"srno", value.serial_number},
         {"input", value.input},
         {"expected_output", value.expected_output}};
}

void from_json(const json &j, test_case &value) {
    j.at("srno").get_to(value.serial_number);
    j.at("input").get_to(value.input);
    j.at("expected_output").get_to(value.expected_output);
}

void to_json(json &j, const submission_request &value) {
    j = {{"lang", value.language},
         {"source_code", value.source_code},
         {"test_cases", value.test_cases}};
}

void from_json(const json &j, submission_request &value) {
    j.at("lang").get_to(value.language);
    j.at("source_code").get_to(value.source_code);
    if (j.count("test_cases"))
        j.at("test_cases").get_to(value.test_cases);
    else
        value.test_cases.clear();
}

string generate_task_id() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool is_valid_task_id(const string &task_id) {
    // string_generator 也接受 {...} 和不带连字符的形式，而 task_id 会用于拼接文件路径，
    // 因此只接受标准的 36 字符格式
    if (task_id.size() != 36) return false;
    try {
        boost::uuids::string_generator()(task_id);
        return true;
    } catch (std::runtime_error &) {
        return false;
    }
}

void to_json(json &j, const queued_job &value) {
    j = {{"task_id", value.task_id},
         {"task_request", value.request}};
}

void from_json(const json &j, queued_job &value) {
    j.at("task_id").get_to(value.task_id);
    if (!is_valid_task_id(value.task_id))
        throw invalid_argument("task_id is not a valid UUID: " + value.task_id);
    j.at("task_request").get_to(value.request);
}

void to_json(json &j, const test_case_result &value) {
    j = {{"srno", value.serial_number},
         {"status", value.status},
         {"stdout", value.stdout_text},
         {"stderr", value.stderr_text}};
}

void from_json(const json &j, test_case_result &value) {
    j.at("srno").get_to(value.serial_number);
    j.at("status").get_to(value.status);
    j.at("stdout").get_to(value.stdout_text);
    j.at("stderr").get_to(value.stderr_text);
}

void to_json(json &j, const task_status_record &value) {
    j = {{"task_id", value.task_id},
         {"compiler_error_msg", value.compiler_error_message},
         {"status", (int)value.status},
         {"test_case_result", value.test_case_results},
         {"created_at", value.created_at}};
}

static lifecycle_state parse_lifecycle_state(const json &j) {
    int status = j.get<int>();
    if (status == (int)lifecycle_state::PENDING) return lifecycle_state::PENDING;
    if (status == (int)lifecycle_state::COMPLETED) return lifecycle_state::COMPLETED;
    throw invalid_argument("unknown task status " + to_string(status));
}

void from_json(const json &j, task_status_record &value) {
    j.at("task_id").get_to(value.task_id);
    value.status = parse_lifecycle_state(j.at("status"));
    j.at("compiler_error_msg").get_to(value.compiler_error_message);
    j.at("test_case_result").get_to(value.test_case_results);
    j.at("created_at").get_to(value.created_at);
}

void task_status_update::apply(task_status_record &record) const {
    if (status) record.status = *status;
    if (compiler_error_message) record.compiler_error_message = *compiler_error_message;
    if (test_case_results) record.test_case_results = *test_case_results;
}

void to_json(json &j, const task_status_update &value) {
    j = json::object();
    if (value.status) j["status"] = (int)*value.status;
    if (value.compiler_error_message) j["compiler_error_msg"] = *value.compiler_error_message;
    if (value.test_case_results) j["test_case_result"] = *value.test_case_results;
}

void from_json(const json &j, test_run_request &value) {
    j.at("lang").get_to(value.language);
    j.at("source_code").get_to(value.source_code);
    if (j.count("stdin"))
        j.at("stdin").get_to(value.stdin_text);
    else
        value.stdin_text = "";
}

void to_json(json &j, const test_run_response &value) {
    j = {{"lang", value.language},
         {"compiler_err", value.compiler_error},
         {"stdout", value.stdout_text},
         {"stderr", value.stderr_text},
         {"status", value.status}};
}

void to_json(json &j, const task_response &value) {
    j = {{"task_id", value.task_id},
         {"status", value.status},
         {"message", value.message}};
}

}  // namespace engine
