#pragma once
#include <queue>
#include <mutex>
#include <future>
#include <memory>
#include <functional>
#include <type_traits>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace localmesh::dispatch {

// Single event-processing context. Every task runs on one worker thread in
// the order it was posted.
class Dispatcher {
public:
    Dispatcher() = default;
    ~Dispatcher();
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start();
    void stop();
    void post(std::function<void()> task);
    bool isWorkerThread() const;

    // Must not be waited on from the worker thread itself.
    template <typename Fn>
    auto invoke(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future;
    }

private:
    std::mutex mutex_;
    std::queue<std::function<void()>> taskQueue_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    bool stopping_ = false;
};

}
