#include "RunnerTypes.h"

namespace taskpool {

    const char* to_string(JobState s) noexcept {
        switch (s) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
        default:                  return "?";
        }
    }

} // namespace taskpool
