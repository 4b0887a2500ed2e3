#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

#include "Runner/BoundedRunner.h"

namespace tests {

    // Single-threaded virtual time. Jobs schedule their completion with at();
    // the test advances time with step(), one timer at a time, so every
    // interleaving is reproducible.
    class ManualClock {
    public:
        using Fn = std::function<void()>;

        uint64_t now() const { return now_; }

        void at(uint64_t delay, Fn fn) { timers_.push(Timer{ now_ + delay, seq_++, std::move(fn) }); }

        // Fires the earliest timer (ties in scheduling order). false when idle.
        bool step() {
            if (timers_.empty()) return false;
            Timer t = timers_.top();
            timers_.pop();
            now_ = t.when;
            t.fn();
            return true;
        }

        void run_all() { while (step()) {} }
        bool idle() const { return timers_.empty(); }

    private:
        struct Timer {
            uint64_t when;
            uint64_t seq;
            Fn fn;
        };
        struct Later {
            bool operator()(const Timer& a, const Timer& b) const {
                return a.when != b.when ? a.when > b.when : a.seq > b.seq;
            }
        };

        uint64_t now_{ 0 };
        uint64_t seq_{ 0 };
        std::priority_queue<Timer, std::vector<Timer>, Later> timers_;
    };

    // What the sleeping jobs observed
    struct JobLog {
        struct Start { size_t index; uint64_t time; size_t running_before; };
        std::vector<Start> starts;
        size_t running{ 0 };
        size_t peak{ 0 };

        bool started(size_t index) const {
            return std::any_of(starts.begin(), starts.end(), [&](const Start& s) { return s.index == index; });
        }
        const Start* start_of(size_t index) const {
            for (const auto& s : starts) if (s.index == index) return &s;
            return nullptr;
        }
    };

    // Sleeps `input` time units, then returns input * 2.
    inline taskpool::AsyncJob<int, int> sleep_job(ManualClock& clock, JobLog& log) {
        return [&clock, &log](const int& v, size_t i, taskpool::JobCompletion<int> done) {
            log.starts.push_back({ i, clock.now(), log.running });
            log.peak = std::max(log.peak, ++log.running);
            clock.at(static_cast<uint64_t>(v), [&log, done, v] {
                --log.running;
                done.resolve(v * 2);
            });
        };
    }

    template <class T>
    bool is_ready(const std::future<T>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    // Pulls one result, advancing the clock while the pull is pending.
    template <class R>
    taskpool::NextResult<R> pull(taskpool::ResultStream<R>& s, ManualClock& clock) {
        auto f = s.next();
        while (!is_ready(f)) {
            if (!clock.step()) throw std::runtime_error("pull still pending with no timers left");
        }
        return f.get();
    }

    struct Delivered {
        size_t index;
        int result;
        uint64_t time;
    };

    // Pulls until the end-of-stream signal; errors propagate.
    inline std::vector<Delivered> pull_all(taskpool::ResultStream<int>& s, ManualClock& clock) {
        std::vector<Delivered> out;
        for (;;) {
            auto n = pull(s, clock);
            if (!n) break;
            out.push_back({ n->index, n->result, clock.now() });
        }
        return out;
    }

} // namespace tests
