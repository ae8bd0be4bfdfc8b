#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * 这个头文件包含评测任务的数据结构及其 JSON 格式
 * 提交消息的格式：
 * {
 *     "task_id": "8c1c6a52-...",
 *     "task_request": {
 *         "lang": "cpp",
 *         "source_code": "...",
 *         "test_cases": [ { "srno": 1, "input": "2 3", "expected_output": "5" } ]
 *     }
 * }
 */
namespace engine {

/**
 * @brief 一个测试点
 */
struct test_case {
    /**
     * @brief 由提交方指定的测试点编号，只用于和评测结果对应，不要求连续或有序
     */
    int serial_number = 0;

    std::string input;

    std::string expected_output;
};

void to_json(nlohmann::json &j, const test_case &value);
void from_json(const nlohmann::json &j, test_case &value);

struct submission_request {
    /**
     * @brief 语言标识，参见 runner/registry.hpp
     */
    std::string language;

    std::string source_code;

    /**
     * @brief 测试点，按照该顺序依次评测
     */
    std::vector<test_case> test_cases;
};

void to_json(nlohmann::json &j, const submission_request &value);
void from_json(const nlohmann::json &j, submission_request &value);

/**
 * @brief 消息队列中的评测任务，入队后不再修改
 */
struct queued_job {
    /**
     * @brief 入队时生成的 UUID，同时用于命名评测文件
     */
    std::string task_id;

    submission_request request;
};

void to_json(nlohmann::json &j, const queued_job &value);

/**
 * @throw std::invalid_argument task_id 不是合法的 UUID
 */
void from_json(const nlohmann::json &j, queued_job &value);

/**
 * @brief 生成随机的 UUID 作为 task_id
 */
std::string generate_task_id();

/**
 * @brief 检查 task_id 是否为标准格式的 UUID
 */
bool is_valid_task_id(const std::string &task_id);

enum class verdict {
    /**
     * @brief 去除首尾空白后，输出与标准输出一致
     */
    PASSED,

    /**
     * @brief 程序正常结束，但输出与标准输出不一致
     */
    FAILED,

    /**
     * @brief 程序运行出错，比如非 0 返回值、被信号杀死、超时
     */
    ERROR
};

NLOHMANN_JSON_SERIALIZE_ENUM(verdict, {{verdict::PASSED, "Passed"},
                                       {verdict::FAILED, "Failed"},
                                       {verdict::ERROR, "Error"}})

/**
 * @brief 评测任务记录的状态，只会从 PENDING 变为 COMPLETED 一次
 */
enum class lifecycle_state {
    PENDING = 1,
    COMPLETED = 2
};

struct test_case_result {
    int serial_number = 0;

    verdict status = verdict::ERROR;

    /**
     * @brief 程序的标准输出，verdict 为 ERROR 时为空
     */
    std::string stdout_text;

    /**
     * @brief 运行错误信息，verdict 为 ERROR 时非空，否则为空
     */
    std::string stderr_text;
};

void to_json(nlohmann::json &j, const test_case_result &value);
void from_json(const nlohmann::json &j, test_case_result &value);

/**
 * @brief 评测结果存储中的一条记录，每个 task_id 恰好一条
 */
struct task_status_record {
    std::string task_id;

    lifecycle_state status = lifecycle_state::PENDING;

    /**
     * @brief 编译错误信息，编译成功时为空
     */
    std::string compiler_error_message;

    std::vector<test_case_result> test_case_results;

    /**
     * @brief 记录插入的时间，自 epoch 起的秒数
     */
    std::time_t created_at = 0;
};

void to_json(nlohmann::json &j, const task_status_record &value);
void from_json(const nlohmann::json &j, task_status_record &value);

/**
 * @brief update_by_id 的参数，只更新非空的字段
 */
struct task_status_update {
    std::optional<lifecycle_state> status;
    std::optional<std::string> compiler_error_message;
    std::optional<std::vector<test_case_result>> test_case_results;

    /**
     * @brief 将更新应用到记录上
     */
    void apply(task_status_record &record) const;
};

void to_json(nlohmann::json &j, const task_status_update &value);

struct test_run_request {
    std::string language;
    std::string source_code;
    std::string stdin_text;
};

void from_json(const nlohmann::json &j, test_run_request &value);

enum class test_run_status {
    INITIAL,
    COMPILER_ERROR,
    RUNTIME_ERROR,
    EXECUTED
};

NLOHMANN_JSON_SERIALIZE_ENUM(test_run_status, {{test_run_status::INITIAL, "Initial"},
                                               {test_run_status::COMPILER_ERROR, "CompilerError"},
                                               {test_run_status::RUNTIME_ERROR, "RuntimeError"},
                                               {test_run_status::EXECUTED, "Executed"}})

/**
 * @brief 同步试运行的结果，不写入评测结果存储
 */
struct test_run_response {
    std::string language;
    std::string compiler_error;
    std::string stdout_text;
    std::string stderr_text;
    test_run_status status = test_run_status::INITIAL;
};

void to_json(nlohmann::json &j, const test_run_response &value);

/**
 * @brief 提交评测任务后返回给提交方的回执
 */
struct task_response {
    std::string task_id;
    std::string status = "Queued";
    std::string message = "Request queued for processing";
};

void to_json(nlohmann::json &j, const task_response &value);

}  // namespace engine
