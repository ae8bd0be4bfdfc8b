#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace engine {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列满时 push 阻塞，直到有读者取走元素，以此实现对消息队列拉取的背压。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列最多容纳多少元素，0 表示不限制
     */
    explicit concurrent_queue(std::size_t capacity = 0) : capacity(capacity) {}

    /**
     * @brief 从队列中弹出队头元素，队列为空时最多等待 timeout
     * @param element 如果成功弹出，则保存队头元素
     * @return 是否在 timeout 内成功弹出元素
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!not_empty.wait_for(mlock, timeout, [this] { return !q.empty(); }))
            return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，队列已满时阻塞等待
     */
    void push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        not_full.wait(mlock, [this] { return capacity == 0 || q.size() < capacity; });
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
    }

    std::size_t size() const {
        std::scoped_lock<std::mutex> lock(mut);
        return q.size();
    }

private:
    std::size_t capacity;
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable not_empty;
    std::condition_variable not_full;
};

}  // namespace engine
