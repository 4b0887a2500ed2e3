#pragma once
#include <cstddef>
#include <future>
#include <iterator>
#include <memory>
#include <utility>

#include "RunnerTypes.h"
#include "Parallel/WorkerPool.h"

namespace taskpool {

    // What the consumer side of a run exposes.
    template <class Result>
    class StreamSource {
    public:
        virtual ~StreamSource() = default;
        virtual std::future<NextResult<Result>> next() = 0;
        virtual RunnerStatus status() const = 0;
        virtual JobState job_state(size_t index) const = 0;
        // Consumer went away: stop admitting, let in-flight jobs finish.
        virtual void abandon() = 0;
    };

    // Pull-based view of a run, results in completion order.
    //
    // next() never blocks: it returns a future that is ready immediately when a
    // result is buffered (or the run ended), otherwise it becomes ready when the
    // next job completes. Only one pull may be outstanding at a time; a second
    // one throws ConcurrentPullError. Terminal errors (JobError,
    // StuckSchedulerError) are stored in the future and repeat on every later pull.
    //
    // begin()/end() give a blocking input range over the same pulls. Only use it
    // when jobs complete on other threads than the consumer's.
    template <class Result>
    class ResultStream {
    public:
        using Next = NextResult<Result>;

        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = IndexedResult<Result>;
            using difference_type = std::ptrdiff_t;
            using pointer = value_type*;
            using reference = value_type&;

            iterator() = default;
            explicit iterator(ResultStream* s) : s_(s) { advance(); }

            reference operator*() { return *cur_; }
            const value_type& operator*() const { return *cur_; }
            pointer operator->() { return &*cur_; }

            iterator& operator++() { advance(); return *this; }
            void operator++(int) { advance(); }

            friend bool operator==(const iterator& it, std::default_sentinel_t) { return !it.cur_.has_value(); }

        private:
            void advance() { cur_ = s_->next().get(); }

            ResultStream* s_ = nullptr;
            Next cur_;
        };

        ResultStream() = default;
        explicit ResultStream(std::shared_ptr<StreamSource<Result>> src, std::shared_ptr<WorkerPool> pool = nullptr)
            : src_(std::move(src)), pool_(std::move(pool)) {}

        ~ResultStream() { close(); }

        ResultStream(const ResultStream&) = delete;
        ResultStream& operator=(const ResultStream&) = delete;

        ResultStream(ResultStream&& o) noexcept
            : src_(std::move(o.src_)), pool_(std::move(o.pool_)) {}

        ResultStream& operator=(ResultStream&& o) noexcept {
            if (this != &o) {
                close();
                src_ = std::move(o.src_);
                pool_ = std::move(o.pool_);
            }
            return *this;
        }

        std::future<Next> next() { return src_->next(); }
        RunnerStatus status() const { return src_->status(); }
        JobState job_state(size_t index) const { return src_->job_state(index); }

        iterator begin() { return iterator(this); }
        std::default_sentinel_t end() const { return {}; }

        explicit operator bool() const { return static_cast<bool>(src_); }

    private:
        void close() noexcept {
            if (src_) src_->abandon();
            if (pool_) pool_->stop();
            pool_.reset();
            src_.reset();
        }

        std::shared_ptr<StreamSource<Result>> src_;
        std::shared_ptr<WorkerPool> pool_;
    };

} // namespace taskpool
