#include "test_common.h"

#include "cordon/bqueue.h"

#include <chrono>
#include <string>
#include <thread>

using cordon::BoundedQueue;

template <typename T>
static void wait_idle(const BoundedQueue<T>& q, size_t n) {
    for (int i = 0; i < 500 && q.idle() < n; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    expect_true(q.idle() >= n, "consumer should be blocked in pop");
}

int main() {
    using Push = BoundedQueue<std::string>::Push;

    // FIFO up to capacity with no consumer
    {
        BoundedQueue<std::string> q(2);
        expect_true(q.try_push("a") == Push::OK, "push a");
        expect_true(q.try_push("b") == Push::OK, "push b");
        expect_true(q.try_push("c") == Push::FULL, "third push is full");
        expect_eq_ll((long long)q.size(), 2, "size 2");
        std::string v;
        expect_true(q.pop(v) && v == "a", "FIFO first");
        expect_true(q.pop(v) && v == "b", "FIFO second");
    }

    // Capacity 0: only an idle consumer can take work
    {
        BoundedQueue<int> q(0);
        expect_true(q.try_push(1) == BoundedQueue<int>::Push::FULL, "no idle consumer, fail fast");

        int got = 0;
        std::thread t([&] {
            int v = 0;
            if (q.pop(v)) got = v;
        });
        wait_idle(q, 1);
        expect_true(q.try_push(7) == BoundedQueue<int>::Push::OK, "idle consumer accepts");
        t.join();
        expect_eq_ll(got, 7, "consumer received item");
    }

    // Shutdown: refuses new work, drains what is queued, then unblocks
    {
        BoundedQueue<int> q(4);
        expect_true(q.try_push(1) == BoundedQueue<int>::Push::OK, "push before shutdown");
        q.shutdown();
        expect_true(q.closed(), "closed");
        expect_true(q.try_push(2) == BoundedQueue<int>::Push::CLOSED, "push after shutdown");
        int v = 0;
        expect_true(q.pop(v) && v == 1, "queued item still delivered");
        expect_true(!q.pop(v), "then pop reports shutdown");
    }

    // Blocking pop unblocks on shutdown
    {
        BoundedQueue<int> q(1);
        bool popped = true;
        std::thread t([&] {
            int v = 0;
            popped = q.pop(v);
        });
        wait_idle(q, 1);
        q.shutdown();
        t.join();
        expect_true(!popped, "pop should return false after shutdown on empty queue");
    }

    std::cerr << "test_bounded_queue: ALL PASSED" << std::endl;
    return 0;
}
