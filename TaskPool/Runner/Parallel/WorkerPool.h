#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "TSQueue.h"

namespace taskpool {

    // Fixed set of threads draining one task queue. Used to run blocking job
    // functions; the bounded runner decides how many are queued at once.
    class WorkerPool {
    public:
        using Task = std::function<void()>;

        explicit WorkerPool(size_t workers, std::string name = "Worker");
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        // false once stop() has been called
        bool submit(Task t);

        // Refuse new tasks, let queued ones finish, join the threads. Idempotent.
        void stop();

        size_t worker_count() const { return threads_.size(); }
        size_t queued() const { return tasks_.size(); }
        uint64_t tasks_done() const { return done_.load(); }

    private:
        void worker_main(size_t idx);

        std::string name_;
        TSQueue<Task> tasks_;
        std::vector<std::thread> threads_;
        std::atomic<bool> stopped_{ false };
        std::atomic<uint64_t> done_{ 0 };
    };

} // namespace taskpool
