#include "Dispatcher.hpp"

#include <exception>
#include <spdlog/spdlog.h>

using namespace localmesh::dispatch;

void Dispatcher::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return !taskQueue_.empty() || stopping_; });
                if (taskQueue_.empty())
                    return;
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("dispatcher: task threw: {}", e.what());
            }
        }
    });
}

void Dispatcher::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        taskQueue_.push(std::move(task));
    }
    cv_.notify_one();
}

bool Dispatcher::isWorkerThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void Dispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    running_ = false;
}

Dispatcher::~Dispatcher() {
    stop();
    // Tasks left behind (never started) are dropped here; pending invoke()
    // futures then report broken_promise.
    std::queue<std::function<void()>>().swap(taskQueue_);
}
