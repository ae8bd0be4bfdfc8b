#include <filesystem>
#include <functional>
#include <map>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "store/memory_task_store.hpp"
#include "test/mock_job_server.hpp"
#include "worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace engine;

static const char *HELLO = R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })";

/**
 * @brief 记录确认消息时评测记录的状态
 */
struct recording_job_server : public server::mock::configuration {
    explicit recording_job_server(task_store &store) : store(store) {}

    void acknowledge(const message::job_delivery &delivery) override {
        auto record = store.find_by_id(delivery.job.task_id);
        {
            lock_guard<mutex> guard(mut);
            states_at_ack[delivery.job.task_id] = record ? optional<lifecycle_state>(record->status) : nullopt;
        }
        server::mock::configuration::acknowledge(delivery);
    }

    map<string, optional<lifecycle_state>> states() {
        lock_guard<mutex> guard(mut);
        return states_at_ack;
    }

private:
    task_store &store;
    mutex mut;
    map<string, optional<lifecycle_state>> states_at_ack;
};

class WorkerTest : public ::testing::Test {
protected:
    path run_dir;

    void SetUp() override {
        run_dir = temp_directory_path() / ("worker-test-" + generate_task_id());
        create_directories(run_dir);
    }

    void TearDown() override {
        remove_all(run_dir);
    }

    static queued_job make_job(const string &language, const string &source) {
        queued_job job;
        job.task_id = generate_task_id();
        job.request.language = language;
        job.request.source_code = source;
        job.request.test_cases = {{1, "", "hello world"}};
        return job;
    }

    static bool wait_for(function<bool()> cond, chrono::seconds timeout) {
        elapsed_time timer;
        while (!cond()) {
            if (timer.duration<chrono::seconds>() > timeout) return false;
            this_thread::sleep_for(chrono::milliseconds(50));
        }
        return true;
    }
};

TEST_F(WorkerTest, EveryJobAcknowledgedAfterCompletion) {
    memory_task_store store;
    task_orchestrator orchestrator(store, run_dir, chrono::seconds(5));
    recording_job_server server(store);

    vector<queued_job> jobs;
    for (int i = 0; i < 4; ++i) jobs.push_back(make_job("cpp", HELLO));
    for (auto &job : jobs) server.push(job);

    const size_t workers = 2;
    concurrent_queue<message::job_delivery> job_queue(workers);
    vector<thread> threads;
    threads.push_back(start_consumer(server, job_queue));
    for (size_t i = 0; i < workers; ++i)
        threads.push_back(start_worker(i, server, orchestrator, job_queue));

    bool finished = wait_for([&] { return server.acknowledged_count() == jobs.size(); }, chrono::seconds(120));
    stop_workers();
    for (auto &th : threads) th.join();
    ASSERT_TRUE(finished);

    auto states = server.states();
    for (auto &job : jobs) {
        ASSERT_TRUE(states.count(job.task_id));
        EXPECT_EQ(states[job.task_id], lifecycle_state::COMPLETED);
        auto record = store.find_by_id(job.task_id);
        ASSERT_TRUE(record);
        ASSERT_EQ(record->test_case_results.size(), 1u);
        EXPECT_EQ(record->test_case_results[0].status, verdict::PASSED);
    }
    EXPECT_EQ(server.acknowledged_count(), jobs.size());
    EXPECT_TRUE(directory_iterator(run_dir) == directory_iterator());
}

TEST_F(WorkerTest, FailedJobsAreAcknowledged) {
    memory_task_store store;
    task_orchestrator orchestrator(store, run_dir, chrono::seconds(5));
    recording_job_server server(store);

    queued_job unsupported = make_job("brainfuck", "+++");
    server.push_malformed();
    server.push(unsupported);

    concurrent_queue<message::job_delivery> job_queue(1);
    vector<thread> threads;
    threads.push_back(start_consumer(server, job_queue));
    threads.push_back(start_worker(0, server, orchestrator, job_queue));

    bool finished = wait_for([&] { return server.acknowledged_count() == 2; }, chrono::seconds(30));
    stop_workers();
    for (auto &th : threads) th.join();
    ASSERT_TRUE(finished);

    // 不支持的语言导致评测失败，评测记录停留在 PENDING，但消息仍然被确认
    EXPECT_EQ(server.states()[unsupported.task_id], lifecycle_state::PENDING);
    EXPECT_EQ(server.acknowledged_tasks(), vector<string>({"malformed", unsupported.task_id}));
}

TEST_F(WorkerTest, StopDrainsQueue) {
    memory_task_store store;
    task_orchestrator orchestrator(store, run_dir, chrono::seconds(5));
    recording_job_server server(store);

    vector<queued_job> jobs;
    for (int i = 0; i < 3; ++i) jobs.push_back(make_job("cpp", HELLO));
    for (auto &job : jobs) server.push(job);

    concurrent_queue<message::job_delivery> job_queue(1);
    vector<thread> threads;
    threads.push_back(start_consumer(server, job_queue));
    // 等待 consumer 拉取至少一个评测任务之后再启动 worker
    ASSERT_TRUE(wait_for([&] { return server.pending_count() < jobs.size(); }, chrono::seconds(10)));
    stop_workers();
    threads.push_back(start_worker(0, server, orchestrator, job_queue));
    for (auto &th : threads) th.join();

    // 所有被拉取的评测任务都在 worker 退出前完成并确认
    EXPECT_EQ(server.acknowledged_count() + server.pending_count(), jobs.size());
    EXPECT_GE(server.acknowledged_count(), 1u);
    for (auto &[task_id, state] : server.states())
        EXPECT_EQ(state, lifecycle_state::COMPLETED) << task_id;
}
