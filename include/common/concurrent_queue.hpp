#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace codegrade {

/**
 * @brief Blocking multi-producer multi-consumer queue.
 * Elements are moved in and out, so move-only jobs (holding a
 * std::promise for example) can be queued.
 * @param <T> element type
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief Pop the head element, blocking while the queue is empty.
     */
    T pop() {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty()) cond.wait(mlock);
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    void push(T &&value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace codegrade
