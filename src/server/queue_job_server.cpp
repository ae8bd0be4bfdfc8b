#include "server/queue_job_server.hpp"
#include <glog/logging.h>

namespace engine::server {
using namespace std;
using namespace nlohmann;

job_server::~job_server() = default;

queue_job_server::queue_job_server(const amqp &config, uint16_t prefetch)
    : fetcher(make_unique<rabbitmq>(config, /* write */ false, prefetch)) {}

bool queue_job_server::fetch_job(message::job_delivery &delivery, chrono::milliseconds timeout) {
    AmqpClient::Envelope::ptr_t envelope;
    if (!fetcher->fetch(envelope, timeout)) return false;

    try {
        delivery.job = json::parse(envelope->Message()->Body()).get<queued_job>();
        delivery.envelope = envelope;
        return true;
    } catch (std::exception &ex) {
        // 格式不正确的消息永远无法评测，确认后丢弃，避免被无限次重新投递
        LOG(ERROR) << "Dropping malformed job message: " << envelope->Message()->Body();
        fetcher->ack(envelope);
        throw;
    }
}

void queue_job_server::acknowledge(const message::job_delivery &delivery) {
    fetcher->ack(any_cast<AmqpClient::Envelope::ptr_t>(delivery.envelope));
}

job_publisher::job_publisher(const amqp &config)
    : reporter(make_unique<rabbitmq>(config, /* write */ true)) {}

task_response job_publisher::submit(const submission_request &request) {
    queued_job job;
    job.task_id = generate_task_id();
    job.request = request;
    reporter->publish(json(job).dump());
    LOG(INFO) << "Queued task " << job.task_id;

    task_response response;
    response.task_id = job.task_id;
    return response;
}

}  // namespace engine::server
