#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>

namespace taskpool {

    // Lifecycle of one input. Pending -> Running -> (Completed | Failed), once.
    enum class JobState : uint8_t { Pending, Running, Completed, Failed };

    const char* to_string(JobState s) noexcept;

    using RunningSet = std::set<size_t>;

    // Veto for starting `index` while the indices in `running` are executing.
    // Called with the runner's bookkeeping locked: must not touch the same stream.
    using CandidatePredicate = std::function<bool(size_t index, const RunningSet& running)>;

    // One delivered outcome, paired with the input it came from
    template <class Result>
    struct IndexedResult {
        size_t index{ 0 };
        Result result{};
    };

    // nullopt is the end-of-stream signal
    template <class Result>
    using NextResult = std::optional<IndexedResult<Result>>;

    // Runner status snapshot (UI/console)
    struct RunnerStatus {
        size_t inputs{ 0 };
        size_t pending{ 0 };
        size_t running{ 0 };
        size_t completed{ 0 };
        size_t buffered{ 0 };      // completed but not yet pulled
        bool pull_waiting{ false };
        bool terminated{ false };  // no further admission will happen
        bool failed{ false };
    };

} // namespace taskpool
