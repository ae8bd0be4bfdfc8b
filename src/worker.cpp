#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace engine {
using namespace std;
using namespace engine::server;

// 停止 worker 的标记
static atomic<bool> stop(false);

// consumer 是否已经退出，此后不会再有新的评测任务
static atomic<bool> consumer_exited(false);

const chrono::milliseconds FETCH_TIMEOUT(100);
const chrono::milliseconds POP_TIMEOUT(100);
const chrono::milliseconds FETCH_ERROR_DELAY(1000);

void stop_workers() {
    stop = true;
}

static void consumer_loop(job_server &server, concurrent_queue<message::job_delivery> &job_queue) {
    LOG(INFO) << "Consumer started, waiting for jobs";
    while (!stop) {
        message::job_delivery delivery;
        try {
            if (!server.fetch_job(delivery, FETCH_TIMEOUT)) continue;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to fetch job: " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            this_thread::sleep_for(FETCH_ERROR_DELAY);
            continue;
        }

        LOG(INFO) << "Received task " << delivery.job.task_id;
        // 所有 worker 都在评测且队列已满时阻塞，实现背压
        job_queue.push(move(delivery));
    }
    LOG(INFO) << "Consumer stopped";
}

thread start_consumer(job_server &server, concurrent_queue<message::job_delivery> &job_queue) {
    stop = false;
    consumer_exited = false;
    return thread([&server, &job_queue] {
        defer { consumer_exited = true; };
        consumer_loop(server, job_queue);
    });
}

/**
 * @brief 评测一个任务并确认消息
 * 评测失败（比如不支持的语言、无法写入评测记录）只记录日志，消息仍然被确认，
 * 评测记录可能停留在 PENDING 状态。
 */
static void process_job(size_t worker_id, job_server &server, task_orchestrator &orchestrator, const message::job_delivery &delivery) {
    try {
        orchestrator.execute(delivery.job);
        LOG(INFO) << "Worker " << worker_id << " completed task " << delivery.job.task_id;
    } catch (engine_exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed to judge task " << delivery.job.task_id << ": " << ex.what() << endl
                   << ex;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed to judge task " << delivery.job.task_id << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    }

    try {
        server.acknowledge(delivery);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed to acknowledge task " << delivery.job.task_id << ": " << ex.what();
    }
}

static void worker_loop(size_t worker_id, job_server &server, task_orchestrator &orchestrator, concurrent_queue<message::job_delivery> &job_queue) {
    LOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        message::job_delivery delivery;
        if (!job_queue.pop_for(delivery, POP_TIMEOUT)) {
            // 如果需要停止 worker，在 consumer 退出且评测队列为空时自然退出 worker。
            // consumer 退出后不会再推入新的评测任务。
            if (stop && consumer_exited) break;
            continue;
        }
        process_job(worker_id, server, orchestrator, delivery);
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, job_server &server, task_orchestrator &orchestrator, concurrent_queue<message::job_delivery> &job_queue) {
    return thread([=, &server, &orchestrator, &job_queue] {
        worker_loop(worker_id, server, orchestrator, job_queue);
    });
}

}  // namespace engine
