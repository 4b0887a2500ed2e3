#pragma once
#include <cstddef>
#include <vector>

#include "RunnerTypes.h"

namespace taskpool {

    // Decides which pending inputs may start. Knows nothing about job types:
    // it moves indices between the pending list and the running set.
    // Not thread-safe; the owning run serializes access.
    class AdmissionController {
    public:
        AdmissionController(size_t input_count, size_t max_at_once, CandidatePredicate pred);

        // One admission pass. Every admitted index is moved to the running set and
        // appended to `admitted`, in launch order. The scan restarts at the head of
        // the pending list after each admission since the predicate sees a new
        // running set. A throwing predicate leaves `admitted` holding what was
        // admitted before it threw.
        void fill(std::vector<size_t>& admitted);

        // Undo admissions whose jobs were never invoked; restores input order.
        void unadmit(const std::vector<size_t>& indices);

        // index stopped running (succeeded or failed)
        void finish(size_t index);

        // Work remains and nothing is running to ever change the predicate's mind.
        bool stuck() const { return !pending_.empty() && running_.empty(); }

        const std::vector<size_t>& pending() const { return pending_; }
        const RunningSet& running() const { return running_; }
        size_t max_at_once() const { return max_at_once_; }
        bool has_predicate() const { return static_cast<bool>(pred_); }

    private:
        std::vector<size_t> pending_;
        RunningSet running_;
        size_t max_at_once_;
        CandidatePredicate pred_;
    };

} // namespace taskpool
