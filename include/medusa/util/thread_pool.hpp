#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace medusa {

    // Fixed set of workers draining one FIFO job queue. Jobs still queued at
    // destruction are run before the workers exit.
    class ThreadPool {
    public:
        explicit ThreadPool(std::size_t n) {
            if (n == 0) n = 1;
            workers_.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                workers_.emplace_back([this] { run(); });
            }
        }
        ~ThreadPool() {
            { std::lock_guard<std::mutex> lk(m_); stop_ = true; }
            cv_.notify_all();
            for (auto& t : workers_) t.join();
        }
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        std::size_t size() const { return workers_.size(); }

        // Fire-and-forget; the job must not throw.
        void post(std::function<void()> job) {
            {
                std::lock_guard<std::mutex> lk(m_);
                q_.push(std::move(job));
            }
            cv_.notify_one();
        }

    private:
        void run() {
            for (;;) {
                std::function<void()> job;
                {
                    std::unique_lock<std::mutex> lk(m_);
                    cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
                    if (stop_ && q_.empty()) return;
                    job = std::move(q_.front()); q_.pop();
                }
                job();
            }
        }

        std::mutex m_;
        std::condition_variable cv_;
        std::queue<std::function<void()>> q_;
        std::vector<std::thread> workers_;
        bool stop_ = false;
    };

} // namespace medusa
