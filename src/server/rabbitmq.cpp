#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"
#include "config.hpp"

namespace engine::server {
using namespace std;

rabbitmq::rabbitmq(const amqp &amqp, bool write, uint16_t prefetch) : queue(amqp), write(write), prefetch(prefetch) {
    retry("Connecting to RabbitMQ " + queue.hostname + ":" + to_string(queue.port),
          CONNECT_MAX_RETRIES, CONNECT_RETRY_INTERVAL, [this] { connect(); });
}

void rabbitmq::connect() {
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port, queue.username, queue.password, queue.vhost);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    if (!queue.exchange.empty()) {
        channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
        channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
    }
    if (!write)  // 对于从消息队列读取消息的情况，我们需要监听队列
        tag = channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, prefetch);
    LOG(INFO) << "Connected to RabbitMQ " << queue.hostname << ":" << queue.port << ", queue: " << queue.queue;
}

bool rabbitmq::fetch(AmqpClient::Envelope::ptr_t &envelope, chrono::milliseconds timeout) {
    scoped_lock guard(mut);
    return channel->BasicConsumeMessage(tag, envelope, (int)timeout.count());
}

void rabbitmq::ack(const AmqpClient::Envelope::ptr_t &envelope) {
    scoped_lock guard(mut);
    channel->BasicAck(envelope);
}

void rabbitmq::publish(const string &message) {
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
    msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    msg->ContentType("application/json");

    string routing_key = queue.exchange.empty() ? queue.queue : queue.routing_key;
    DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << routing_key << std::endl
               << message;

    scoped_lock guard(mut);
    channel->BasicPublish(queue.exchange, routing_key, msg);
    DLOG(INFO) << "Sending message succeeded";
}

}  // namespace engine::server
