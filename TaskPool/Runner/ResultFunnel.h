#pragma once
#include <deque>
#include <exception>
#include <future>
#include <optional>
#include <utility>

#include "RunnerErrors.h"
#include "RunnerTypes.h"

namespace taskpool {

    // A resolved pull that has to be fulfilled once the runner lock is released.
    template <class Result>
    struct Handoff {
        std::promise<NextResult<Result>> slot;
        NextResult<Result> value;
        std::exception_ptr error;

        void fulfil() {
            if (error) slot.set_exception(error);
            else slot.set_value(std::move(value));
        }
    };

    // Rendezvous between completions (any order, any time) and a consumer that
    // pulls one result at a time. Unbounded queue for a producer that is ahead,
    // a single pending-pull slot for a consumer that is ahead. Never both:
    // the slot is only registered while the queue is empty.
    //
    // Not thread-safe; the owning run serializes access.
    template <class Result>
    class ResultFunnel {
    public:
        using Next = NextResult<Result>;

        // Producer side. Returns the handoff to fulfil when a pull was waiting.
        std::optional<Handoff<Result>> arrive(IndexedResult<Result> cell) {
            if (error_) return std::nullopt;  // run already failed, discard
            if (slot_) {
                Handoff<Result> h{ std::move(*slot_), Next(std::move(cell)), nullptr };
                slot_.reset();
                return h;
            }
            queue_.push_back(std::move(cell));
            return std::nullopt;
        }

        // First error wins. Buffered results stay ahead of it.
        std::optional<Handoff<Result>> fail(std::exception_ptr e) {
            if (error_) return std::nullopt;
            error_ = std::move(e);
            if (slot_) {
                Handoff<Result> h{ std::move(*slot_), std::nullopt, error_ };
                slot_.reset();
                return h;
            }
            return std::nullopt;
        }

        // Consumer side. `exhausted` means every input has completed.
        std::future<Next> pull(bool exhausted) {
            std::promise<Next> p;
            auto f = p.get_future();
            if (!queue_.empty()) {
                p.set_value(Next(std::move(queue_.front())));
                queue_.pop_front();
            }
            else if (error_) {
                p.set_exception(error_);
            }
            else if (exhausted) {
                p.set_value(std::nullopt);
            }
            else if (slot_) {
                throw ConcurrentPullError();
            }
            else {
                slot_.emplace(std::move(p));
            }
            return f;
        }

        bool failed() const { return static_cast<bool>(error_); }
        bool pull_waiting() const { return slot_.has_value(); }
        size_t buffered() const { return queue_.size(); }

    private:
        std::deque<IndexedResult<Result>> queue_;
        std::optional<std::promise<Next>> slot_;
        std::exception_ptr error_;
    };

} // namespace taskpool
