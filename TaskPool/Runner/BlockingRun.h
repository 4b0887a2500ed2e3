#pragma once
#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "BoundedRunner.h"
#include "Parallel/WorkerPool.h"

namespace taskpool {

    template <class Input, class Result>
    using BlockingJob = std::function<Result(const Input& input, size_t index)>;

    // run() for plain synchronous functions: each job executes on a pool of
    // min(max_at_once, inputs) threads owned by the returned stream. Destroying
    // the stream waits for the jobs still executing.
    template <class Input, class Result>
    ResultStream<Result> run_blocking(BlockingJob<Input, Result> fn, size_t max_at_once, std::vector<Input> inputs,
        CandidatePredicate pred = {})
    {
        if (max_at_once == 0) throw std::invalid_argument("run_blocking: max_at_once must be at least 1");
        if (!fn) throw std::invalid_argument("run_blocking: empty job function");

        const size_t threads = std::max<size_t>(1, std::min(max_at_once, inputs.size()));
        auto pool = std::make_shared<WorkerPool>(threads, "Job");
        std::weak_ptr<WorkerPool> weak_pool = pool;

        AsyncJob<Input, Result> job = [fn = std::move(fn), weak_pool](const Input& input, size_t index,
            JobCompletion<Result> done) {
            auto p = weak_pool.lock();
            if (!p) return;  // stream already gone
            const bool queued = p->submit([fn, input, index, done] {
                std::optional<Result> r;
                try {
                    r.emplace(fn(input, index));
                }
                catch (...) {
                    done.reject(std::current_exception());
                    return;
                }
                done.resolve(std::move(*r));
            });
            if (!queued) TPLOGD("job %zu not queued, pool is stopping", index);
        };

        auto state = std::make_shared<RunState<Input, Result>>(std::move(job), max_at_once, std::move(inputs),
            std::move(pred));
        state->start();
        return ResultStream<Result>(state, pool);
    }

} // namespace taskpool
