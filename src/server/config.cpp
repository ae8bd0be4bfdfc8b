#include "server/config.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace engine::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("hostname").get_to(mq.hostname);
    if (j.count("port"))
        j.at("port").get_to(mq.port);
    if (j.count("queue"))
        j.at("queue").get_to(mq.queue);
    if (j.count("exchange"))
        j.at("exchange").get_to(mq.exchange);
    if (j.count("exchange_type"))
        j.at("exchange_type").get_to(mq.exchange_type);
    if (j.count("routing_key"))
        j.at("routing_key").get_to(mq.routing_key);
    if (j.count("username"))
        j.at("username").get_to(mq.username);
    if (j.count("password"))
        j.at("password").get_to(mq.password);
    if (j.count("vhost"))
        j.at("vhost").get_to(mq.vhost);
}

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    j.at("port").get_to(redis_config.port);
    if (j.count("password"))
        j.at("password").get_to(redis_config.password);
    if (j.count("retry_interval"))
        j.at("retry_interval").get_to(redis_config.retry_interval);
    if (j.count("channel"))
        j.at("channel").get_to(redis_config.channel);
    if (j.count("key_prefix"))
        j.at("key_prefix").get_to(redis_config.key_prefix);
}

void from_json(const json &j, engine_config &config) {
    j.at("amqp").get_to(config.queue);
    config.has_redis = j.count("redis") > 0;
    if (config.has_redis)
        j.at("redis").get_to(config.redis_config);
}

engine_config load_config(const filesystem::path &config_path) {
    if (!filesystem::exists(config_path))
        throw configuration_error("Configuration file " + config_path.string() + " does not exist");
    try {
        return json::parse(read_file_content(config_path)).get<engine_config>();
    } catch (json::exception &ex) {
        throw configuration_error("Malformed configuration file " + config_path.string() + ": " + ex.what());
    }
}

}  // namespace engine::server
