#include "dispatcher/Dispatcher.hpp"

#include <cassert>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace localmesh;

int main() {
    // Tasks run in post order on a single worker thread.
    {
        dispatch::Dispatcher dispatcher;
        dispatcher.start();

        std::vector<int> order;
        std::thread::id worker_id;
        for (int i = 0; i < 100; ++i) {
            dispatcher.post([&order, &worker_id, &dispatcher, i]() {
                assert(dispatcher.isWorkerThread());
                if (i == 0) {
                    worker_id = std::this_thread::get_id();
                }
                assert(std::this_thread::get_id() == worker_id);
                order.push_back(i);
            });
        }
        const auto size = dispatcher.invoke([&order]() { return order.size(); }).get();
        assert(size == 100);
        for (int i = 0; i < 100; ++i) {
            assert(order[i] == i);
        }
        assert(!dispatcher.isWorkerThread());
        dispatcher.stop();
    }

    // A throwing task does not take the worker down.
    {
        dispatch::Dispatcher dispatcher;
        dispatcher.start();
        dispatcher.post([]() { throw std::runtime_error("boom"); });
        assert(dispatcher.invoke([]() { return 7; }).get() == 7);

        auto failing = dispatcher.invoke([]() -> int { throw std::runtime_error("through the future"); });
        bool thrown = false;
        try {
            failing.get();
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
        dispatcher.stop();
    }

    // stop() runs what was already queued; later posts are dropped.
    {
        dispatch::Dispatcher dispatcher;
        dispatcher.start();
        int ran = 0;
        for (int i = 0; i < 10; ++i) {
            dispatcher.post([&ran]() { ++ran; });
        }
        dispatcher.stop();
        assert(ran == 10);

        auto late = dispatcher.invoke([]() { return 1; });
        bool broken = false;
        try {
            late.get();
        } catch (const std::future_error&) {
            broken = true;
        }
        assert(broken);
        assert(ran == 10);
    }

    return 0;
}
