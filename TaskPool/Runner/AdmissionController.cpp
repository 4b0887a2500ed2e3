#include "AdmissionController.h"

#include <algorithm>
#include <numeric>

namespace taskpool {

    AdmissionController::AdmissionController(size_t input_count, size_t max_at_once, CandidatePredicate pred)
        : pending_(input_count), max_at_once_(max_at_once), pred_(std::move(pred))
    {
        std::iota(pending_.begin(), pending_.end(), size_t{ 0 });
    }

    void AdmissionController::fill(std::vector<size_t>& admitted)
    {
        size_t i = 0;
        while (i < pending_.size() && running_.size() < max_at_once_) {
            const size_t candidate = pending_[i];
            if (pred_ && !pred_(candidate, running_)) {
                ++i;
                continue;
            }

            pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(i));
            running_.insert(candidate);
            admitted.push_back(candidate);
            // Start over because acceptance might have changed
            i = 0;
        }
    }

    void AdmissionController::unadmit(const std::vector<size_t>& indices)
    {
        for (size_t idx : indices) {
            if (running_.erase(idx) == 0) continue;
            pending_.insert(std::lower_bound(pending_.begin(), pending_.end(), idx), idx);
        }
    }

    void AdmissionController::finish(size_t index)
    {
        running_.erase(index);
    }

} // namespace taskpool
