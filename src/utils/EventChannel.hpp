#pragma once
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

// 多生产者/单消费者的先进先出队列。
// 引擎线程 push，界面线程按固定间隔 tryPop/drain。
template <typename T>
class EventChannel {
private:
    std::queue<T> events;
    mutable std::mutex queueMutex;
    std::condition_variable queueCV;

public:
    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            events.push(std::move(event));
        }
        queueCV.notify_one();
    }

    // 非阻塞读取，队列为空时返回false
    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (events.empty()) {
            return false;
        }
        out = std::move(events.front());
        events.pop();
        return true;
    }

    // 最多等待timeout，超时返回false
    template <typename Rep, typename Period>
    bool waitPop(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(queueMutex);
        if (!queueCV.wait_for(lock, timeout, [this]() { return !events.empty(); })) {
            return false;
        }
        out = std::move(events.front());
        events.pop();
        return true;
    }

    // 取出当前所有事件，保持顺序
    std::vector<T> drain() {
        std::vector<T> result;
        std::lock_guard<std::mutex> lock(queueMutex);
        while (!events.empty()) {
            result.push_back(std::move(events.front()));
            events.pop();
        }
        return result;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(queueMutex);
        return events.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(queueMutex);
        return events.size();
    }
};
