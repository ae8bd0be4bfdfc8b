#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include <chrono>
#include <string>
#include <thread>
#include "common/exceptions.hpp"

namespace engine {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 带有限次重试的调用
 * 第一次调用失败后，每隔 interval 重试一次，最多重试 max_retries 次。
 * 重试次数用尽后抛出 network_error，由调用方决定是否终止进程。
 * @param what 日志中描述当前操作的名字
 * @param fn 要执行的操作，失败时抛出 std::exception
 * @return fn 的返回值
 */
template <typename Fn>
auto retry(const std::string &what, unsigned max_retries, std::chrono::milliseconds interval, Fn &&fn) -> decltype(fn()) {
    for (unsigned retries = 0;; ++retries) {
        try {
            return fn();
        } catch (std::exception &ex) {
            if (retries >= max_retries) {
                BOOST_THROW_EXCEPTION(network_error(fmt::format("{} failed after {} retries: {}", what, retries, ex.what())));
            }
            LOG(WARNING) << what << " failed: " << ex.what() << ". Retrying in " << interval.count() << "ms...";
            std::this_thread::sleep_for(interval);
        }
    }
}

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace engine
