#include "RunnerErrors.h"

#include <sstream>

namespace taskpool {

    std::string JobError::describe(const std::exception_ptr& e) {
        if (!e) return "unknown error";
        try {
            std::rethrow_exception(e);
        }
        catch (const std::exception& ex) {
            return ex.what();
        }
        catch (...) {
            return "non-standard exception";
        }
    }

    JobError::JobError(size_t index, std::exception_ptr cause)
        : PoolError("job " + std::to_string(index) + " failed: " + describe(cause)),
        index_(index), cause_(std::move(cause)) {}

    StuckSchedulerError::StuckSchedulerError(std::vector<size_t> indices, bool had_predicate)
        : PoolError(make_message(indices, had_predicate)), indices_(std::move(indices)) {}

    std::string StuckSchedulerError::make_message(const std::vector<size_t>& indices, bool had_predicate) {
        const bool one = indices.size() == 1;
        std::ostringstream os;
        os << "Task pool is stuck. " << indices.size() << " input" << (one ? "" : "s")
            << " will never be processed!";
        if (had_predicate)
            os << "\nMake sure the candidate predicate can accept these inputs once nothing else is running!";
        os << "\nInput" << (one ? "" : "s") << " that will not be processed: ";
        for (size_t i = 0; i < indices.size(); ++i) {
            if (i) os << ", ";
            os << indices[i];
        }
        return os.str();
    }

} // namespace taskpool
