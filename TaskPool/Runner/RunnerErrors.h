#pragma once
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskpool {

    // Base of every error that terminates a run
    class PoolError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A job reported failure (or threw while being started).
    class JobError : public PoolError {
    public:
        JobError(size_t index, std::exception_ptr cause);

        size_t index() const noexcept { return index_; }
        std::exception_ptr cause() const noexcept { return cause_; }

        // what() of the wrapped exception, or a placeholder for non-std ones
        static std::string describe(const std::exception_ptr& e);

    private:
        size_t index_;
        std::exception_ptr cause_;
    };

    // Inputs remain, nothing runs, and the predicate rejects every candidate.
    class StuckSchedulerError : public PoolError {
    public:
        StuckSchedulerError(std::vector<size_t> indices, bool had_predicate);

        const std::vector<size_t>& indices() const noexcept { return indices_; }

    private:
        static std::string make_message(const std::vector<size_t>& indices, bool had_predicate);
        std::vector<size_t> indices_;
    };

    // A second pull was issued while one is still outstanding.
    class ConcurrentPullError : public std::logic_error {
    public:
        ConcurrentPullError() : std::logic_error("next() called while a previous pull is still pending") {}
    };

} // namespace taskpool
