#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace engine {

struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出异常时的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示配置错误
 * 比如提交了不支持的语言、配置文件缺少字段，在产生任何副作用之前抛出
 */
struct configuration_error : public engine_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示读写评测文件（源代码、可执行文件）时出现的错误
 * 只会导致当前评测任务失败
 */
struct io_error : public engine_exception {
    io_error();
    explicit io_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常是无法连接到消息队列
 */
struct network_error : public engine_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示评测结果存储的读写错误
 */
struct database_error : public engine_exception {
    database_error();
    explicit database_error(const std::string &message);
};

}  // namespace engine
