#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

namespace localmesh::rpc {

// One server-streaming call. push() may be called from any thread; run()
// blocks the gRPC handler thread and writes messages until the client goes
// away or close() is called. A slow reader loses the oldest messages.
template <typename Message>
class EventStream final : public std::enable_shared_from_this<EventStream<Message>> {
public:
    explicit EventStream(grpc::ServerWriter<Message>* writer, std::size_t maxPending = 1024)
        : writer_(writer), maxPending_(maxPending) {};

    void push(Message message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            if (pending_.size() >= maxPending_) {
                pending_.pop_front();
                if (dropped_++ == 0)
                    spdlog::warn("rpc: subscriber is not reading, dropping oldest messages");
            }
            pending_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

    void run(grpc::ServerContext* context) {
        while (true) {
            Message message;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                // Cancellation is only observable by polling the context.
                cv_.wait_for(lock, std::chrono::milliseconds(250), [this]() { return closed_ || !pending_.empty(); });
                if (closed_) return;
                if (context->IsCancelled()) {
                    closed_ = true;
                    return;
                }
                if (pending_.empty()) continue;
                message = std::move(pending_.front());
                pending_.pop_front();
            }
            if (!writer_->Write(message)) {
                close();
                return;
            }
        }
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            pending_.clear();
        }
        cv_.notify_all();
    }

    bool isClosed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    grpc::ServerWriter<Message>* writer_;
    std::size_t maxPending_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> pending_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

}
