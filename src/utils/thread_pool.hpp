#ifndef NEXUS_BRIDGE_THREAD_POOL_HPP
#define NEXUS_BRIDGE_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    // Fixed set of worker threads draining a FIFO of tasks. The destructor finishes queued work before joining.
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        // Returns false once shutdown() has been called; the task is dropped.
        bool enqueue(std::function<void()> next_task);
        void wait_all();
        void shutdown();

        [[nodiscard]] size_t size() const { return threads_.size(); }
        [[nodiscard]] size_t active_tasks() const { return active_tasks_.load(); }

       private:
        void worker_loop();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::condition_variable completion_cv_;
        bool stop_ = false;
        std::atomic<size_t> active_tasks_ = 0;
    };
}  // namespace concurrency

#endif
