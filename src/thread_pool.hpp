#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Contiguous share [first, last) of n items for worker `index` out of `parts`.
// Shares are disjoint, in order, and cover [0, n) exactly.
inline void band_range(int n, int parts, int index, int& first, int& last)
{
    first = static_cast<int>(static_cast<long long>(n) * index / parts);
    last  = static_cast<int>(static_cast<long long>(n) * (index + 1) / parts);
}

// Persistent workers that run one static partition at a time. Each
// parallel_for() hands every worker its own band of the index range, so
// bodies writing per-index output never overlap. The return of
// parallel_for() is the only join point.
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        n_workers = n_threads;
        workers.reserve(static_cast<size_t>(n_threads));
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this, i] { worker_loop(i); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_start.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Calls body(first, last) once per non-empty band of [0, n) and blocks
    // until all bands are done. Not reentrant: one caller at a time.
    void parallel_for(int n, const std::function<void(int, int)>& body)
    {
        if (n <= 0) return;
        std::unique_lock<std::mutex> lock(mtx);
        batch_body = &body;
        batch_n    = n;
        running    = n_workers;
        ++generation;
        cv_start.notify_all();
        cv_done.wait(lock, [this] { return running == 0; });
        batch_body = nullptr;
    }

private:
    void worker_loop(int index)
    {
        unsigned seen = 0;
        for (;;) {
            const std::function<void(int, int)>* body;
            int n;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_start.wait(lock, [&] { return stopping || generation != seen; });
                if (stopping) return;
                seen = generation;
                body = batch_body;
                n    = batch_n;
            }

            int first, last;
            band_range(n, n_workers, index, first, last);
            if (first < last) (*body)(first, last);

            std::lock_guard<std::mutex> lock(mtx);
            if (--running == 0) cv_done.notify_all();
        }
    }

    int                                   n_workers = 0;
    std::vector<std::thread>              workers;
    std::mutex                            mtx;
    std::condition_variable               cv_start;
    std::condition_variable               cv_done;
    const std::function<void(int, int)>*  batch_body = nullptr;
    int                                   batch_n    = 0;
    int                                   running    = 0;
    unsigned                              generation = 0;
    bool                                  stopping   = false;
};
