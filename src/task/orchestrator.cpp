#include "task/orchestrator.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <ctime>
#include <system_error>
#include "common/utils.hpp"
#include "runner/registry.hpp"

namespace engine {
using namespace std;

task_paths make_task_paths(const filesystem::path &run_dir, const string &task_id, const string &language) {
    task_paths paths;
    paths.workdir = run_dir / task_id;
    paths.source = paths.workdir / ("code" + task_id + "." + source_extension(language));
    paths.artifact = paths.workdir / ("binary" + task_id);
    return paths;
}

verdict judge_output(const string &actual, const string &expected) {
    if (boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected))
        return verdict::PASSED;
    else
        return verdict::FAILED;
}

static void cleanup(runner &r, const task_paths &paths) {
    r.cleanup(paths.source, paths.artifact);
    filesystem::remove_all(paths.workdir);
}

/**
 * @brief 执行 fn，无论 fn 是否抛出异常，最后都清理评测文件
 * fn 抛出异常时，清理过程中的错误只记录日志，向外传递 fn 的异常
 */
template <typename Fn>
static void with_cleanup(runner &r, const task_paths &paths, Fn &&fn) {
    try {
        fn();
    } catch (...) {
        try {
            cleanup(r, paths);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to clean up " << paths.workdir << ": " << ex.what();
        }
        throw;
    }
    cleanup(r, paths);
}

task_orchestrator::task_orchestrator(task_store &store, const filesystem::path &run_dir, chrono::milliseconds time_limit)
    : store(store), run_dir(run_dir), time_limit(time_limit) {}

test_case_result task_orchestrator::evaluate(runner &r, const filesystem::path &artifact_path, const test_case &tc) {
    test_case_result result;
    result.serial_number = tc.serial_number;
    try {
        visit(overloaded{
                  [&](const execution_output &output) {
                      result.stdout_text = output.stdout_text;
                      result.status = judge_output(output.stdout_text, tc.expected_output);
                  },
                  [&](const execution_error &error) {
                      result.status = verdict::ERROR;
                      result.stderr_text = error.message;
                  }},
              r.execute(artifact_path, tc.input));
    } catch (system_error &ex) {
        result.status = verdict::ERROR;
        result.stderr_text = ex.what();
    }
    return result;
}

task_status_record task_orchestrator::execute(const queued_job &job) {
    const string &task_id = job.task_id;
    const submission_request &request = job.request;

    LOG(INFO) << "Step 1 => Initializing task " << task_id << " [" << request.language << "]";
    task_status_record record;
    record.task_id = task_id;
    record.status = lifecycle_state::PENDING;
    record.created_at = time(nullptr);
    store.insert(record);

    runner_uptr r = make_runner(request.language, request.source_code, time_limit);
    task_paths paths = make_task_paths(run_dir, task_id, request.language);

    task_status_update update;
    update.status = lifecycle_state::COMPLETED;
    update.compiler_error_message = "";
    update.test_case_results = vector<test_case_result>();

    with_cleanup(*r, paths, [&] {
        filesystem::create_directories(paths.workdir);
        r->initialize(paths.source);

        LOG(INFO) << "Step 2 => Compiling task " << task_id;
        bool compiled = true;
        try {
            string note = r->compile(paths.source, paths.artifact);
            DLOG(INFO) << "Task " << task_id << ": " << note;
        } catch (compilation_error &ex) {
            LOG(INFO) << "Task " << task_id << " failed to compile";
            update.compiler_error_message = ex.error_log;
            compiled = false;
        }

        if (compiled) {
            LOG(INFO) << "Step 3 => Running " << request.test_cases.size() << " test cases of task " << task_id;
            for (auto &tc : request.test_cases) {
                test_case_result result = evaluate(*r, paths.artifact, tc);
                LOG(INFO) << "Task " << task_id << " test case " << tc.serial_number << ": " << nlohmann::json(result.status);
                update.test_case_results->push_back(result);
            }
        }

        LOG(INFO) << "Step 4 => Writing results of task " << task_id;
        store.update_by_id(task_id, update);
    });
    LOG(INFO) << "Step 5 => Cleaned up task " << task_id;

    update.apply(record);
    return record;
}

test_run_response task_orchestrator::test_run(const test_run_request &request) {
    test_run_response response;
    response.language = request.language;

    string run_id = generate_task_id();
    runner_uptr r = make_runner(request.language, request.source_code, time_limit);
    task_paths paths = make_task_paths(run_dir, run_id, request.language);

    LOG(INFO) << "Test run " << run_id << " [" << request.language << "]";
    with_cleanup(*r, paths, [&] {
        filesystem::create_directories(paths.workdir);
        r->initialize(paths.source);
        try {
            r->compile(paths.source, paths.artifact);
        } catch (compilation_error &ex) {
            response.compiler_error = ex.error_log;
            response.status = test_run_status::COMPILER_ERROR;
            return;
        }

        visit(overloaded{
                  [&](const execution_output &output) {
                      response.stdout_text = output.stdout_text;
                      response.status = test_run_status::EXECUTED;
                  },
                  [&](const execution_error &error) {
                      response.stderr_text = error.message;
                      response.status = test_run_status::RUNTIME_ERROR;
                  }},
              r->execute(paths.artifact, request.stdin_text));
    });
    return response;
}

}  // namespace engine
