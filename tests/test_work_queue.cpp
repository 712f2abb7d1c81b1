#include "test_common.h"
#include "patchbench/work_queue.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace patchbench;

int main() {
    // FIFO, close drains what is left
    {
        ConcurrentQueue<std::string> q;
        expect_true(q.push("a"), "push a");
        expect_true(q.push("b"), "push b");
        expect_eq_ll((long long)q.size(), 2, "size");
        q.close();
        expect_true(q.closed(), "closed");
        expect_true(!q.push("c"), "push after close rejected");
        std::string v;
        expect_true(q.pop(v) && v == "a", "first out");
        expect_true(q.pop(v) && v == "b", "second out");
        expect_true(!q.pop(v), "closed and empty");
    }

    // Consumers block until items arrive; every item is taken exactly once
    {
        ConcurrentQueue<int> q;
        std::atomic<long long> sum{0};
        std::atomic<int> taken{0};
        std::vector<std::thread> consumers;
        for (int c = 0; c < 4; c++) {
            consumers.emplace_back([&]() {
                int v = 0;
                while (q.pop(v)) {
                    sum += v;
                    taken++;
                }
            });
        }
        for (int i = 1; i <= 1000; i++) q.push(i);
        q.close();
        for (auto& t : consumers) t.join();
        expect_eq_ll(taken.load(), 1000, "all items consumed");
        expect_eq_ll(sum.load(), 500500, "each item once");
    }

    // close wakes idle consumers
    {
        ConcurrentQueue<int> q;
        std::thread waiter([&]() {
            int v = 0;
            expect_true(!q.pop(v), "woken by close");
        });
        q.close();
        waiter.join();
    }

    std::cerr << "test_work_queue: ALL PASSED" << std::endl;
    return 0;
}
