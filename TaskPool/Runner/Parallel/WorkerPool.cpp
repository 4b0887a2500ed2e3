#include "WorkerPool.h"
#include "../../Utils/Log.h"
#include "../../Utils/ThreadName.h"

#include <algorithm>
#include <exception>

namespace taskpool {

    WorkerPool::WorkerPool(size_t workers, std::string name)
        : name_(std::move(name))
    {
        workers = std::max<size_t>(1, workers);
        threads_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads_.emplace_back([this, i] { worker_main(i); });
        }
        TPLOGD("[%s] pool started with %zu threads", name_.c_str(), workers);
    }

    WorkerPool::~WorkerPool() { stop(); }

    bool WorkerPool::submit(Task t)
    {
        if (stopped_.load()) return false;
        return tasks_.push(std::move(t));
    }

    void WorkerPool::stop()
    {
        if (stopped_.exchange(true)) return;
        tasks_.close();

        const auto self = std::this_thread::get_id();
        for (auto& th : threads_) {
            if (!th.joinable()) continue;
            // a task tearing down its own pool: the thread exits once the queue drains
            if (th.get_id() == self) th.detach();
            else th.join();
        }
        TPLOGD("[%s] pool stopped after %llu tasks", name_.c_str(), (unsigned long long)done_.load());
    }

    void WorkerPool::worker_main(size_t idx)
    {
        utils::set_this_thread_name(name_ + "-" + std::to_string(idx));

        Task t;
        while (tasks_.pop_wait(t)) {
            try {
                t();
            }
            catch (const std::exception& e) {
                TPLOGE("[%s-%zu] task threw: %s", name_.c_str(), idx, e.what());
            }
            catch (...) {
                TPLOGE("[%s-%zu] task threw a non-standard exception", name_.c_str(), idx);
            }
            t = nullptr;
            done_.fetch_add(1);
        }
    }

} // namespace taskpool
