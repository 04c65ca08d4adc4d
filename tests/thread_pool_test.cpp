#include "../libmaintlog/include/thread_pool.hpp"

#include <atomic>
#include <cassert>
#include <future>
#include <stdexcept>
#include <vector>

using maintlog::ThreadPool;

int main() {
    // results come back through futures in submission order
    {
        ThreadPool pool(4);
        assert(pool.size() == 4);
        std::vector<std::future<int>> futures;
        for (int i = 0; i < 100; ++i) {
            futures.push_back(pool.submit([i] { return i * i; }));
        }
        for (int i = 0; i < 100; ++i) {
            assert(futures[i].get() == i * i);
        }
    }

    // exceptions surface at get()
    {
        ThreadPool pool(2);
        auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
        bool thrown = false;
        try {
            (void)failing.get();
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    // destruction runs everything still queued
    {
        std::atomic<int> done{0};
        {
            ThreadPool pool(1);
            for (int i = 0; i < 50; ++i) {
                (void)pool.submit([&done] { ++done; });
            }
        }
        assert(done.load() == 50);
    }

    // zero threads still gives a working pool
    {
        ThreadPool pool(0);
        assert(pool.size() == 1);
        assert(pool.submit([] { return 7; }).get() == 7);
    }
    return 0;
}
