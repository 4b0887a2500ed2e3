#pragma once
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "AdmissionController.h"
#include "JobCompletion.h"
#include "ResultFunnel.h"
#include "ResultStream.h"
#include "RunnerErrors.h"
#include "RunnerTypes.h"
#include "../Utils/Log.h"

namespace taskpool {

    // An asynchronous job: start the work for (input, index) and settle `done`
    // when it finishes, now or later, on any thread. The call itself should
    // return promptly: launches and deliveries posted meanwhile wait for it.
    template <class Input, class Result>
    using AsyncJob = std::function<void(const Input& input, size_t index, JobCompletion<Result> done)>;

    // State of one run. Every mutation of the pending list, running set and
    // funnel happens under mu_. Launches and pull handoffs are queued as
    // actions under the lock and executed after it is released by a single
    // draining thread at a time, so a job that settles synchronously from
    // inside its call only appends to the queue instead of nesting.
    template <class Input, class Result>
    class RunState final
        : public CompletionSink<Result>,
          public StreamSource<Result>,
          public std::enable_shared_from_this<RunState<Input, Result>> {
    public:
        using Next = NextResult<Result>;
        using Job = AsyncJob<Input, Result>;

        RunState(Job job, size_t max_at_once, std::vector<Input> inputs, CandidatePredicate pred)
            : job_(std::move(job)),
            inputs_(std::move(inputs)),
            admission_(inputs_.size(), max_at_once, std::move(pred)),
            states_(inputs_.size(), JobState::Pending) {}

        // Initial admission pass. Separate from the constructor because launching
        // needs shared_from_this().
        void start() {
            bool drain_here = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                TPLOGD("run started: %zu inputs, max %zu at once%s", inputs_.size(),
                    admission_.max_at_once(), admission_.has_predicate() ? ", with predicate" : "");
                std::vector<size_t> launch;
                auto h = admit_locked(launch);
                drain_here = post_locked(launch, std::move(h));
            }
            if (drain_here) drain();
        }

        std::future<Next> next() override {
            bool drain_here = false;
            std::future<Next> f;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (funnel_.pull_waiting()) throw ConcurrentPullError();
                // the predicate may depend on state outside the run, so every pull
                // gets another chance to admit
                std::vector<size_t> launch;
                auto h = admit_locked(launch);
                f = funnel_.pull(completed_ == inputs_.size());
                drain_here = post_locked(launch, std::move(h));
            }
            if (drain_here) drain();
            return f;
        }

        void job_succeeded(size_t index, Result result) override {
            bool drain_here = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                admission_.finish(index);
                states_[index] = JobState::Completed;
                ++completed_;
                if (terminated_) {
                    TPLOGD("job %zu finished after the run terminated, result dropped", index);
                    return;
                }
                TPLOGT("job %zu completed (%zu/%zu)", index, completed_, inputs_.size());
                // queue first so a stuck error found by the backfill lands behind it
                auto delivered = funnel_.arrive(IndexedResult<Result>{ index, std::move(result) });
                std::vector<size_t> launch;
                auto failed = admit_locked(launch);
                // backfill before the consumer sees the outcome
                drain_here = post_locked(launch, std::move(delivered), std::move(failed));
            }
            if (drain_here) drain();
        }

        void job_failed(size_t index, std::exception_ptr error) override {
            bool drain_here = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                admission_.finish(index);
                states_[index] = JobState::Failed;
                if (terminated_) {
                    TPLOGD("job %zu failed after the run terminated: %s", index, JobError::describe(error).c_str());
                    return;
                }
                TPLOGE("job %zu failed: %s", index, JobError::describe(error).c_str());
                drain_here = post_locked({}, terminate_locked(std::make_exception_ptr(JobError(index, error))));
            }
            if (drain_here) drain();
        }

        RunnerStatus status() const override {
            std::lock_guard<std::mutex> lk(mu_);
            RunnerStatus s{};
            s.inputs = inputs_.size();
            s.pending = admission_.pending().size();
            s.running = admission_.running().size();
            s.completed = completed_;
            s.buffered = funnel_.buffered();
            s.pull_waiting = funnel_.pull_waiting();
            s.terminated = terminated_ || completed_ == inputs_.size();
            s.failed = funnel_.failed();
            return s;
        }

        JobState job_state(size_t index) const override {
            std::lock_guard<std::mutex> lk(mu_);
            return states_.at(index);
        }

        void abandon() override {
            std::lock_guard<std::mutex> lk(mu_);
            if (terminated_) return;
            terminated_ = true;
            if (completed_ < inputs_.size())
                TPLOGD("stream dropped with %zu running and %zu pending", admission_.running().size(),
                    admission_.pending().size());
        }

    private:
        // A job index to invoke, or a pull to fulfil
        using Action = std::variant<size_t, Handoff<Result>>;

        // Fills free slots, then checks for a deadlock. Returns the handoff of a
        // waiting pull when the run just failed.
        std::optional<Handoff<Result>> admit_locked(std::vector<size_t>& launch) {
            if (terminated_) return std::nullopt;
            try {
                admission_.fill(launch);
            }
            catch (...) {
                auto error = std::current_exception();
                TPLOGE("candidate predicate threw: %s", JobError::describe(error).c_str());
                admission_.unadmit(launch);
                launch.clear();
                return terminate_locked(std::move(error));
            }
            for (size_t i : launch) states_[i] = JobState::Running;

            if (admission_.stuck()) {
                const auto& left = admission_.pending();
                TPLOGW("scheduler stuck: %zu inputs can never start", left.size());
                return terminate_locked(std::make_exception_ptr(
                    StuckSchedulerError(left, admission_.has_predicate())));
            }
            return std::nullopt;
        }

        std::optional<Handoff<Result>> terminate_locked(std::exception_ptr error) {
            terminated_ = true;
            return funnel_.fail(std::move(error));
        }

        // Queues launches, then handoffs, in that order. Returns true when the
        // caller has to drain because no other call is draining already.
        bool post_locked(const std::vector<size_t>& launch, std::optional<Handoff<Result>> first,
            std::optional<Handoff<Result>> second = std::nullopt) {
            for (size_t i : launch) actions_.emplace_back(std::in_place_type<size_t>, i);
            if (first) actions_.emplace_back(std::move(*first));
            if (second) actions_.emplace_back(std::move(*second));
            if (draining_ || actions_.empty()) return false;
            draining_ = true;
            return true;
        }

        void drain() {
            auto self = this->shared_from_this();
            for (;;) {
                Action a;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    if (actions_.empty()) {
                        draining_ = false;
                        return;
                    }
                    a = std::move(actions_.front());
                    actions_.pop_front();
                }
                if (auto* h = std::get_if<Handoff<Result>>(&a)) h->fulfil();
                else launch(self, std::get<size_t>(a));
            }
        }

        void launch(const std::shared_ptr<RunState>& self, size_t i) {
            TPLOGD("launching job %zu", i);
            JobCompletion<Result> done(self, i);
            try {
                job_(inputs_[i], i, done);
            }
            catch (...) {
                auto error = std::current_exception();
                if (!done.reject_if_unsettled(error))
                    TPLOGE("job %zu threw after settling: %s", i, JobError::describe(error).c_str());
            }
        }

        const Job job_;
        const std::vector<Input> inputs_;

        mutable std::mutex mu_;
        AdmissionController admission_;
        ResultFunnel<Result> funnel_;
        std::vector<JobState> states_;
        std::deque<Action> actions_;
        bool draining_{ false };
        size_t completed_{ 0 };
        bool terminated_{ false };
    };

    // Runs `job` for every input with at most `max_at_once` in flight and returns
    // the results as they complete. `pred` (optional) may veto starting an input
    // given the set of running ones.
    template <class Input, class Result>
    ResultStream<Result> run(AsyncJob<Input, Result> job, size_t max_at_once, std::vector<Input> inputs,
        CandidatePredicate pred = {})
    {
        if (max_at_once == 0) throw std::invalid_argument("run: max_at_once must be at least 1");
        if (!job) throw std::invalid_argument("run: empty job function");

        auto state = std::make_shared<RunState<Input, Result>>(std::move(job), max_at_once, std::move(inputs),
            std::move(pred));
        state->start();
        return ResultStream<Result>(state);
    }

} // namespace taskpool
